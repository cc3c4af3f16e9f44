#pragma once

#include <stdexcept>
#include <string>

namespace stagehand
{

// Base of every exception raised by stagehand. All of them are precondition
// violations reported synchronously; the object that raised one is left
// exactly as it was before the call.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// Negative, NaN or infinite duration passed to append/act/advance.
class InvalidDurationError : public Error
{
   public:
    using Error::Error;
};

// Negative or NaN time passed to resolve/state_at/action_at/update.
class OutOfRangeQueryError : public Error
{
   public:
    using Error::Error;
};

// A custom snapshot key is missing, or a custom action dropped a key that
// its start state carries.
class UnknownKeyError : public Error
{
   public:
    explicit UnknownKeyError(const std::string& key)
        : Error("unknown state key '" + key + "'"), key_(key)
    {
    }

    const std::string& key() const { return key_; }

   private:
    std::string key_;
};

// Destination value whose type does not match the action kind.
class InvalidDestinationError : public Error
{
   public:
    using Error::Error;
};

}   // namespace stagehand
