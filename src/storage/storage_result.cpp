#include "uplink/storage/storage_result.hpp"

namespace uplink::storage {

const char* to_string(StorageError error) {
    switch (error) {
        case StorageError::SUCCESS: return "success";
        case StorageError::NOT_FOUND: return "not_found";
        case StorageError::IO_ERROR: return "io_error";
        case StorageError::INVALID_ARGUMENT: return "invalid_argument";
        case StorageError::DATABASE_ERROR: return "database_error";
    }
    return "unknown";
}

}
