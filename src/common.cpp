#include "common.hpp"

#include <cstdlib>
#include <iostream>

void contractViolation(const char* what) {
    std::cerr << "CONTRACT VIOLATION: " << (what ? what : "(unspecified)") << "\n";
    std::cerr.flush();
    std::abort();
}
