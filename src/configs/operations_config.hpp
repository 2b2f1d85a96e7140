#ifndef OPERATIONS_CONFIG_HPP
#define OPERATIONS_CONFIG_HPP

namespace DirectoryHasher {
namespace Config {

struct OperationsConfig {
    // When false, an identifier held by a live operation is replaced by a fresh one
    // and written back to the caller. When true, such a request is rejected.
    bool reject_live_id_collision = false;
};

} // namespace Config
} // namespace DirectoryHasher

#endif // OPERATIONS_CONFIG_HPP
