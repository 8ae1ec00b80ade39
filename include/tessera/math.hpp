#pragma once

#include <tessera/math/checked.hpp>
#include <tessera/math/error.hpp>
