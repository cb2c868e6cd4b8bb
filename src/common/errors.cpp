#include "common/errors.hpp"

namespace dbsnap {

namespace {

class BackupCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "dbsnap.backup"; }

    std::string message(int ev) const override {
        switch (static_cast<BackupErrc>(ev)) {
            case BackupErrc::integrity_check_failed:
                return "integrity check failed";
            case BackupErrc::pre_restore_snapshot_failed:
                return "pre-restore snapshot failed";
            case BackupErrc::unknown_strategy:
                return "unknown snapshot strategy";
        }
        return "unknown backup error";
    }
};

} // anonymous namespace

const std::error_category& backup_category() noexcept {
    static const BackupCategory category;
    return category;
}

std::error_code make_error_code(BackupErrc e) noexcept {
    return {static_cast<int>(e), backup_category()};
}

} // namespace dbsnap
