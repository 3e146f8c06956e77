#include "hkr/cli/app.hpp"

int main(int argc, char* argv[]) {
  return hkr::cli::run_app(argc, argv);
}
