#include <iostream>

#include "safe-log.h"

#include "test-handshake-state.h"
#include "test-automaton.h"
#include "test-session.h"
#include "test-table-loader.h"
#include "test-session-manager.h"
#include "test-driver.h"

int main() {
  handshake::SetLogLevel(handshake::LogLevel::kQuiet);

  test_handshake_state();
  test_automaton();
  test_session();
  test_table_loader();
  test_session_manager();
  test_driver();
  std::cerr << "----------------" << std::endl;

  return 0;
}
