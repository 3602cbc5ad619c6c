#pragma once

#include <mintage/state/account.hpp>
#include <mintage/state/codec.hpp>
#include <mintage/state/error.hpp>
#include <mintage/state/mint.hpp>
#include <mintage/state/rent.hpp>
