#pragma once

#include <tessera/encode/hex.hpp>
