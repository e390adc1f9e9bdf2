#ifndef _HANDSHAKE_TABLE_LOADER_H_
#define _HANDSHAKE_TABLE_LOADER_H_

#include <iosfwd>
#include <string>

#include "automaton.h"

namespace handshake {
// Text form of an AutomatonDefinition, one item per line:
//
//   # comment
//   .states CLOSED LISTEN SYN_SENT SYN_RECEIVED ESTABLISHED ERROR
//   .alphabet LISTEN SYN SYN_ACK ACK
//   .start CLOSED
//   .accept ESTABLISHED
//   CLOSED LISTEN -> LISTEN
//
// Missing directives fall back to the canonical values. Syntax errors throw
// ConfigError naming the line. Semantic checks are left to Automaton.
AutomatonDefinition LoadDefinition(std::istream &in);
AutomatonDefinition LoadDefinitionFromString(const std::string &text);
AutomatonDefinition LoadDefinitionFromFile(const std::string &path);

} // namespace handshake

#endif // _HANDSHAKE_TABLE_LOADER_H_
