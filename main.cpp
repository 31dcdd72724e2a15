#include <exception>
#include <iostream>

#include "include/driver.hpp"

int main(int argc, char const **argv) {
  try {
    return crosshatch::driver::Run(crosshatch::driver::InputPaths(argc, argv),
                                   std::cout);
  } catch (std::exception const &e) {
    std::cerr << "Exception: " << e.what() << '\n';
    return 1;
  }
}
