#pragma once

#include <methodxml/assert.hpp>
#include <methodxml/attribute.hpp>
#include <methodxml/builder.hpp>
#include <methodxml/config.hpp>
#include <methodxml/error.hpp>
#include <methodxml/escape.hpp>
#include <methodxml/expected.hpp>
#include <methodxml/kind.hpp>
#include <methodxml/logger.hpp>
#include <methodxml/member_span_cache.hpp>
#include <methodxml/names.hpp>
#include <methodxml/number.hpp>
#include <methodxml/source_text.hpp>
#include <methodxml/span_markers.hpp>
#include <methodxml/symbol.hpp>
#include <methodxml/text_span.hpp>
#include <methodxml/writer.hpp>
