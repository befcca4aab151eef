#pragma once

#include <custodia/crypto/error.hpp>
#include <custodia/crypto/hash.hpp>
#include <custodia/crypto/public_key.hpp>
#include <custodia/crypto/secret_key.hpp>
#include <custodia/crypto/signature.hpp>
