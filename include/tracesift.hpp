#pragma once

#include "tracesift/compile_id.hpp"
#include "tracesift/config.hpp"
#include "tracesift/context.hpp"
#include "tracesift/directory.hpp"
#include "tracesift/envelope.hpp"
#include "tracesift/format.hpp"
#include "tracesift/indices.hpp"
#include "tracesift/intern.hpp"
#include "tracesift/interpreter.hpp"
#include "tracesift/json.hpp"
#include "tracesift/parsers.hpp"
#include "tracesift/ranks.hpp"
#include "tracesift/utils.hpp"
