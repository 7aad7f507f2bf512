#pragma once

// Include in exactly one translation unit to compile the library.

#include <methodxml/impl/assert.ipp>
#include <methodxml/impl/attribute.ipp>
#include <methodxml/impl/builder.ipp>
#include <methodxml/impl/error.ipp>
#include <methodxml/impl/escape.ipp>
#include <methodxml/impl/number.ipp>
#include <methodxml/impl/source_text.ipp>
#include <methodxml/impl/span_markers.ipp>
#include <methodxml/impl/writer.ipp>

#include <iocoro/impl.hpp>
