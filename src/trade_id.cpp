#include "oms/trade_id.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace oms {

std::string TradeIdGenerator::next()
{
    boost::uuids::uuid id;
    {
        // random_generator is not safe for concurrent use
        std::lock_guard<std::mutex> lock(mutex_);
        id = gen_();
    }
    return boost::uuids::to_string(id);
}

} // namespace oms
