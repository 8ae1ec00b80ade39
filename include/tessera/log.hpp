#pragma once

#include <tessera/log/formatter.hpp>
#include <tessera/log/frontend.hpp>
#include <tessera/log/log.hpp>
