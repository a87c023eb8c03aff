#pragma once

// jsonvfy: a header-only, streaming, strict JSON syntax verifier for C++17.
// Reads bytes through a buffered cursor, lexes them one token at a time and
// checks the RFC 8259 grammar (plus unique object keys) without building a
// document tree.

#include <jsonvfy/error.hpp>
#include <jsonvfy/cursor.hpp>
#include <jsonvfy/token.hpp>
#include <jsonvfy/lexer.hpp>
#include <jsonvfy/string_codec.hpp>
#include <jsonvfy/verifier.hpp>
