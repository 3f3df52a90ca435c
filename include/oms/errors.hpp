#pragma once

#include <stdexcept>
#include <string>

#include "oms/types.hpp"

namespace oms {

enum class ErrorKind {
    InvalidOrder,
    DuplicateOrder,
    NotFound,
    UnknownSymbol,
    InvalidRequest,
    InsufficientLiquidity
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * Base of every caller-facing failure of the core.
 *
 * All kinds are recoverable: a throwing operation leaves the books exactly
 * as they were before the call.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidOrder : public Error {
public:
    explicit InvalidOrder(const std::string& what)
        : Error(ErrorKind::InvalidOrder, what) {}
};

class DuplicateOrder : public Error {
public:
    explicit DuplicateOrder(OrderId id)
        : Error(ErrorKind::DuplicateOrder,
                "Order with ID " + std::to_string(id) + " already exists"),
          id_(id) {}

    OrderId order_id() const noexcept { return id_; }

private:
    OrderId id_;
};

class OrderNotFound : public Error {
public:
    explicit OrderNotFound(OrderId id)
        : Error(ErrorKind::NotFound,
                "Order with ID " + std::to_string(id) + " not found"),
          id_(id) {}

    OrderId order_id() const noexcept { return id_; }

private:
    OrderId id_;
};

class UnknownSymbol : public Error {
public:
    explicit UnknownSymbol(const std::string& symbol)
        : Error(ErrorKind::UnknownSymbol, "No order book for symbol " + symbol),
          symbol_(symbol) {}

    const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

class InvalidRequest : public Error {
public:
    explicit InvalidRequest(const std::string& what)
        : Error(ErrorKind::InvalidRequest, what) {}
};

class InsufficientLiquidity : public Error {
public:
    InsufficientLiquidity(Side side, Quantity requested, Quantity available)
        : Error(ErrorKind::InsufficientLiquidity,
                std::string("Insufficient liquidity for ") + to_string(side) +
                " " + std::to_string(requested) + ": only " +
                std::to_string(available) + " available"),
          requested_(requested),
          available_(available) {}

    Quantity requested() const noexcept { return requested_; }
    Quantity available() const noexcept { return available_; }

private:
    Quantity requested_;
    Quantity available_;
};

} // namespace oms
