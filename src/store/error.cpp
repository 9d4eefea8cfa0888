#include "eematrix/store/error.hpp"

namespace eematrix::store {

std::string_view to_string(KeyUsage usage) {
    switch (usage) {
        case KeyUsage::master: return "master";
        case KeyUsage::self_signing: return "self_signing";
        case KeyUsage::user_signing: return "user_signing";
    }
    return "unknown";
}

missing_cross_signing_key::missing_cross_signing_key(KeyUsage usage) :
        secrets_bundle_export_error{
                "The store is missing the " + std::string{to_string(usage)} +
                " cross-signing key"},
        usage{usage} {}

}  // namespace eematrix::store
