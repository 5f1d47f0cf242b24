#ifndef CARBON_TRACKER_SYNC_ERROR_H
#define CARBON_TRACKER_SYNC_ERROR_H

#include <stdexcept>
#include <string>

namespace carbon::tracker {

class SyncError : public std::runtime_error {
   public:
    enum class Type {
        TRANSPORT_ERROR,
        AUTHENTICATION_ERROR,
        CONFIGURATION_ERROR
    };

    SyncError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message) {
        switch (type) {
            case Type::TRANSPORT_ERROR:
                return "[TRANSPORT] " + message;
            case Type::AUTHENTICATION_ERROR:
                return "[AUTHENTICATION] " + message;
            case Type::CONFIGURATION_ERROR:
                return "[CONFIGURATION] " + message;
        }
        return message;
    }

    Type type_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_SYNC_ERROR_H
