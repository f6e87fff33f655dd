#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>
#include <exception>

namespace localdoc {

class localdoc_error : public std::runtime_error {
public:
    explicit localdoc_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Validation (synchronous, never retried)
// ============================================================================

class validation_error : public localdoc_error {
public:
    explicit validation_error(const std::string& msg) : localdoc_error(msg) {}
};

class base_id_mismatch : public validation_error {
public:
    explicit base_id_mismatch(const std::string& msg) : validation_error(msg) {}
};

class malformed_geometry : public validation_error {
public:
    explicit malformed_geometry(const std::string& msg) : validation_error(msg) {}
};

class unsupported_geometry : public validation_error {
public:
    explicit unsupported_geometry(const std::string& msg) : validation_error(msg) {}
};

// ============================================================================
// Local store
// ============================================================================

class missing_adapter : public localdoc_error {
public:
    explicit missing_adapter(const std::string& msg) : localdoc_error(msg) {}
};

class collection_not_found : public localdoc_error {
public:
    explicit collection_not_found(const std::string& name)
        : localdoc_error("Collection not found: " + name) {}
};

/// Raised by storage adapters. The collection keeps its pre-operation state.
class adapter_io_error : public localdoc_error {
public:
    explicit adapter_io_error(const std::string& msg) : localdoc_error(msg) {}
};

class sqlite_error : public adapter_io_error {
public:
    explicit sqlite_error(const std::string& msg) : adapter_io_error(msg) {}
};

/// Stored data could not be decoded; load_all cannot recover from this.
class corrupt_storage : public adapter_io_error {
public:
    explicit corrupt_storage(const std::string& msg) : adapter_io_error(msg) {}
};

// ============================================================================
// Remote faults
// ============================================================================

enum class fault {
    none,
    validation,   // 400
    auth,         // 401
    permission,   // 403, discarded
    conflict,     // 409, retry the upload cycle
    gone,         // 410, discarded
    transport,    // no response / 5xx
    other
};

class remote_error : public localdoc_error {
public:
    remote_error(int status, const std::string& msg)
        : localdoc_error(msg), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

class remote_validation_error : public remote_error {
public:
    remote_validation_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

class auth_error : public remote_error {
public:
    auth_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

class permission_error : public remote_error {
public:
    permission_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

class conflict_error : public remote_error {
public:
    conflict_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

class gone_error : public remote_error {
public:
    gone_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

class transport_error : public remote_error {
public:
    transport_error(int status, const std::string& msg) : remote_error(status, msg) {}
};

inline fault classify_status(int status) {
    if (status >= 200 && status < 300) return fault::none;
    switch (status) {
        case 0:   return fault::transport;
        case 400: return fault::validation;
        case 401: return fault::auth;
        case 403: return fault::permission;
        case 409: return fault::conflict;
        case 410: return fault::gone;
        default:  break;
    }
    return status >= 500 ? fault::transport : fault::other;
}

/// 403 and 410 abandon the local change instead of surfacing it.
inline bool is_discard(fault f) {
    return f == fault::permission || f == fault::gone;
}

inline std::exception_ptr make_fault_error(int status, const std::string& msg) {
    switch (classify_status(status)) {
        case fault::validation: return std::make_exception_ptr(remote_validation_error(status, msg));
        case fault::auth:       return std::make_exception_ptr(auth_error(status, msg));
        case fault::permission: return std::make_exception_ptr(permission_error(status, msg));
        case fault::conflict:   return std::make_exception_ptr(conflict_error(status, msg));
        case fault::gone:       return std::make_exception_ptr(gone_error(status, msg));
        case fault::transport:  return std::make_exception_ptr(transport_error(status, msg));
        case fault::none:
        case fault::other:
            break;
    }
    return std::make_exception_ptr(remote_error(status, msg));
}

} // namespace localdoc

#endif // __cplusplus
