#pragma once

#include <mutex>
#include <string>

#include <boost/uuid/random_generator.hpp>

namespace oms {

/// Thread-safe source of random (v4) UUID strings for trade records.
class TradeIdGenerator {
public:
    std::string next();

private:
    std::mutex                      mutex_;
    boost::uuids::random_generator  gen_;
};

} // namespace oms
