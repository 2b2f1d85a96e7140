#include "hash_operation.hpp"
#include <stdexcept>
#include <utility>

namespace DirectoryHasher {
namespace Core {

std::string operation_state_to_string(OperationState state) {
    switch (state) {
        case OperationState::RUNNING:        return "RUNNING";
        case OperationState::STOP_REQUESTED: return "STOP_REQUESTED";
        case OperationState::COMPLETED:      return "COMPLETED";
        case OperationState::CANCELLED:      return "CANCELLED";
        case OperationState::FAILED:         return "FAILED";
    }
    return "UNKNOWN";
}

bool is_terminal_state(OperationState state) {
    return state == OperationState::COMPLETED ||
           state == OperationState::CANCELLED ||
           state == OperationState::FAILED;
}

HashOperation::HashOperation(OperationId id, std::filesystem::path root)
    : operation_id(id), root_directory(std::move(root)), start_time(std::chrono::steady_clock::now()) {}

std::string HashOperation::tag() const {
    return "op" + std::to_string(operation_id);
}

bool HashOperation::request_stop() {
    stop_flag.store(true, std::memory_order_release);
    OperationState expected_state = OperationState::RUNNING;
    return current_state.compare_exchange_strong(expected_state, OperationState::STOP_REQUESTED);
}

void HashOperation::begin_unit() {
    pending_units.fetch_add(1);
}

bool HashOperation::finish_unit() {
    std::size_t previous_count = pending_units.fetch_sub(1);
    if (previous_count == 0) {
        throw std::logic_error("Operation " + std::to_string(operation_id) + " finished more units than it started");
    }
    return previous_count == 1;
}

void HashOperation::abandon_unit() {
    pending_units.fetch_sub(1);
}

OperationState HashOperation::finalize() {
    OperationState final_state = OperationState::COMPLETED;
    if (root_failed.load()) {
        final_state = OperationState::FAILED;
    } else if (stop_flag.load()) {
        final_state = OperationState::CANCELLED;
    }

    {
        std::lock_guard<std::mutex> lock(finish_mutex);
        current_state.store(final_state);
    }
    finish_cv.notify_all();
    return final_state;
}

void HashOperation::wait_until_finished() {
    std::unique_lock<std::mutex> lock(finish_mutex);
    finish_cv.wait(lock, [&]{ return is_terminal_state(current_state.load()); });
}

} // namespace Core
} // namespace DirectoryHasher
