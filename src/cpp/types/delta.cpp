#include <deltaflow/types/delta.h>

namespace deltaflow {
    std::string_view to_string(Delta delta) noexcept {
        switch (delta) {
            case Delta::Insert:
                return "Insert";
            case Delta::Retract:
                return "Retract";
        }
        return "Unknown";
    }
} // namespace deltaflow
