#pragma once

#include <string>

namespace uplink::storage {

enum class StorageError {
    SUCCESS = 0,
    NOT_FOUND,
    IO_ERROR,
    INVALID_ARGUMENT,
    DATABASE_ERROR
};

const char* to_string(StorageError error);

struct StorageResult {
    StorageError error;
    std::string message;
    
    StorageResult(StorageError err = StorageError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == StorageError::SUCCESS; }
    operator bool() const { return success(); }
};

}
