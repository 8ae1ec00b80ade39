#pragma once

#include <tessera/state_db/state_delta.hpp>
