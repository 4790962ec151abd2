#include "storage/store_error.hpp"

#include <string>

namespace memkv {

namespace {

class StoreCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "store"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::wrong_type:
                return "WRONGTYPE Operation against a key holding the wrong kind of value";
            case StoreErrc::invalid_cursor:
                return "ERR invalid cursor";
        }
        return "ERR unknown store error";
    }
};

} // anonymous namespace

const std::error_category& store_category() noexcept {
    static const StoreCategory category;
    return category;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_category()};
}

} // namespace memkv
