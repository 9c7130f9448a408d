#include "rowguard/cli/router.hpp"

int main(int argc, char** argv) {
  return rowguard::cli::Dispatch(argc, argv);
}
