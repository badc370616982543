#ifndef MAGNETMESH_KERNEL_KERNEL_SESSION_HPP
#define MAGNETMESH_KERNEL_KERNEL_SESSION_HPP

#include "kernel.hpp"
#include <common/errors.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace magnetmesh {

using KernelFactory = std::function<std::unique_ptr<Kernel>()>;

// Exclusive, scoped ownership of the process-wide kernel. Only one session
// may be alive at a time; the kernel is released when the session is
// destroyed, on success and failure alike. After a fatal kernel error the
// session is poisoned and refuses further use.
class KernelSession {
public:
    KernelSession(const KernelFactory& factory, const std::string& model_name);
    ~KernelSession();

    KernelSession(const KernelSession&) = delete;
    KernelSession& operator=(const KernelSession&) = delete;

    Kernel& kernel();
    const std::string& model_name() const { return model_name_; }

    bool failed() const { return failed_; }
    void mark_failed(const std::string& reason);

    // Runs a kernel step; a KernelOperationError poisons the session and is
    // rethrown with the semantic path attached
    template <typename F>
    auto guarded(const std::string& path, F&& step) -> decltype(step(std::declval<Kernel&>())) {
        Kernel& k = kernel();
        try {
            return step(k);
        } catch (const KernelOperationError& e) {
            mark_failed(e.what());
            if (!e.path().empty() || path.empty()) {
                throw;
            }
            throw KernelOperationError(e.what(), path);
        }
    }

    static bool active();

private:
    std::unique_ptr<Kernel> kernel_;
    std::string model_name_;
    bool failed_ = false;
};

}  // namespace magnetmesh

#endif // MAGNETMESH_KERNEL_KERNEL_SESSION_HPP
