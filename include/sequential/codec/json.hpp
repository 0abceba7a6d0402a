#pragma once

// JSON (de)serialization of sequence state. Requires simdjson.

#include "sequential/codec/json/result.hpp"
#include "sequential/codec/json/writer.hpp"
#include "sequential/codec/json/parser.hpp"
