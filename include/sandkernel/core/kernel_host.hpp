/*
 * sandkernel C++ - Kernel Host
 *
 * Main loop of a kernel process ("sandkerneld --kernel"). Reads the init
 * message, starts the interpreter and the capability catalog, then runs
 * scripts one at a time in a single persistent namespace until the
 * daemon says shutdown, closes the socket or goes away.
 *
 * The socket to the daemon arrives on stdin; stdout is pointed at stderr
 * so stray C-level writes cannot corrupt the channel.
 */
#ifndef sandkernel_CORE_KERNEL_HOST_HPP
#define sandkernel_CORE_KERNEL_HOST_HPP

#include "kernel_channel.hpp"
#include "settings.hpp"
#include <string>

namespace sandkernel {

class KernelHost {
public:
    KernelHost();
    ~KernelHost();

    // Process exit code
    int run();

private:
    KernelHost(const KernelHost&);
    KernelHost& operator=(const KernelHost&);

    bool setup_streams();
    bool read_init(KernelChannel& channel, std::string& error);
    void harden();
    int serve(KernelChannel& channel);

    int protocol_fd_;
    SandboxSettings settings_;
    std::string session_id_;
    std::string session_dir_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_KERNEL_HOST_HPP
