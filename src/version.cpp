#include "version.h"
#include "entry.h"
#include <iostream>
#include <iomanip>

namespace dirpost {
    namespace version {

        void print_version_info() {
            std::cout << "dirpost " << STRING << std::endl;
            std::cout << "Protocol: " << PROTOCOL_VERSION << std::endl;
            std::cout << "Git: " << GIT_DESCRIBE << std::endl;
            std::cout << "Build: " << BUILD << std::endl;
        }

        void print_header() {
            std::cout << "dirpost " << std::left << std::setw(10) << STRING
                      << "protocol " << PROTOCOL_VERSION << std::endl;
        }
    }
}
