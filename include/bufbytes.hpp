#pragma once

/*
===============================================================================
bufbytes - Public API
===============================================================================

Single include for users of the library.

Symbols declared in the bufbytes::core namespace form the public surface:
BufferedByteSource, the shipped sources, the error model and the
configuration. Names under a detail or test namespace are not part of it.
===============================================================================
*/

#include <bufbytes/core.hpp>
