#pragma once

// Out-of-line definitions. Include from exactly one translation unit per program.
#include <pipecoro/impl/assert.ipp>

#include <iocoro/impl.hpp>
