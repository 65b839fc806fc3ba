#include <docstore/util/StoreError.hpp>

namespace DocStore {

namespace {

class StoreCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "docstore"; }

    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
        case StoreErrc::NotFound:
            return "record not found";
        case StoreErrc::ValidationFailed:
            return "schema validation failed";
        case StoreErrc::LockTimeout:
            return "timed out waiting for collection lock";
        case StoreErrc::MigrationFailed:
            return "data migration failed";
        case StoreErrc::NoMigrationPath:
            return "no migration path between versions";
        case StoreErrc::InvalidTenant:
            return "invalid tenant identifier";
        case StoreErrc::CorruptCollection:
            return "collection file is corrupt";
        case StoreErrc::NotALookup:
            return "entity type is not a lookup collection";
        }
        return "unknown docstore error";
    }
};

} // namespace

const std::error_category& storeCategory() noexcept {
    static const StoreCategory category;
    return category;
}

} // namespace DocStore
