#ifndef CARBON_TRACKER_STORE_ERROR_H
#define CARBON_TRACKER_STORE_ERROR_H

#include <stdexcept>
#include <string>

namespace carbon::tracker {

class StoreError : public std::runtime_error {
   public:
    enum class Type { DATABASE_ERROR, MIGRATION_ERROR };

    StoreError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)), type_(type) {}

    Type type() const { return type_; }

   private:
    static std::string format_message(Type type, const std::string &message) {
        switch (type) {
            case Type::DATABASE_ERROR:
                return "[DATABASE] " + message;
            case Type::MIGRATION_ERROR:
                return "[MIGRATION] " + message;
        }
        return message;
    }

    Type type_;
};

}  // namespace carbon::tracker

#endif  // CARBON_TRACKER_STORE_ERROR_H
