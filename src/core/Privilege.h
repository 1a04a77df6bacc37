// Linux privilege & sandbox helpers (best-effort; compile-time gated)
#pragma once
namespace open_ports {
void drop_capabilities(bool keep_cap_dac);
// allow_network adds the socket calls reverse DNS needs.
bool apply_seccomp_profile(bool allow_network);
bool is_privilege_available();
bool is_seccomp_available();
}
