#include "kernel_session.hpp"

#include <common/logging.hpp>

#include <atomic>

namespace magnetmesh {

namespace {

// The kernel keeps process-wide state and cannot host two sessions
std::atomic<bool> session_active{false};

}  // namespace

KernelSession::KernelSession(const KernelFactory& factory, const std::string& model_name)
    : model_name_(model_name) {
    bool expected = false;
    if (!session_active.compare_exchange_strong(expected, true)) {
        throw KernelOperationError("a kernel session is already active", model_name);
    }
    try {
        kernel_ = factory();
        if (!kernel_) {
            throw KernelOperationError("kernel factory returned no kernel", model_name);
        }
        kernel_->new_model(model_name);
    } catch (...) {
        kernel_.reset();
        session_active = false;
        throw;
    }
    logging::get_logger()->debug("Kernel session opened for model '{}'", model_name_);
}

KernelSession::~KernelSession() {
    kernel_.reset();
    session_active = false;
    logging::get_logger()->debug("Kernel session for model '{}' released", model_name_);
}

Kernel& KernelSession::kernel() {
    if (failed_) {
        throw KernelOperationError("kernel session reused after a fatal error", model_name_);
    }
    return *kernel_;
}

void KernelSession::mark_failed(const std::string& reason) {
    if (!failed_) {
        logging::get_logger()->error("Kernel session '{}' failed: {}", model_name_, reason);
    }
    failed_ = true;
}

bool KernelSession::active() {
    return session_active;
}

}  // namespace magnetmesh
