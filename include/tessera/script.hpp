#pragma once

#include <tessera/script/script.hpp>
