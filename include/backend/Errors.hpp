// File: Errors.hpp
// Description: Declares the exception raised for input that aborts a run
//              (malformed time or duration fields, unreadable files).

#pragma once

#include <stdexcept>
#include <string>

namespace backend {

class FatalInputError : public std::runtime_error {
public:
    explicit FatalInputError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace backend
