#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog
{

    StoreError::StoreError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace holysheet::catalog
