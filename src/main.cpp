#include "app.h"
#include <utils_log/logger.hpp>

int main(int argc, char *argv[]) {
  LOG_START;
  return App::run(argc, argv);
}
