#pragma once

#include <array>

#include <custodia/crypto/error.hpp>
#include <custodia/crypto/hash.hpp>
#include <custodia/crypto/public_key.hpp>

namespace custodia::crypto {

constexpr std::size_t recoverable_signature_length = signature_length + public_key_length;

/**
 * An Ed25519 signature followed by the public key of its signer.
 */
using recoverable_signature = std::array< std::byte, recoverable_signature_length >;

/**
 * Recover the public key that produced a signature over a digest.
 *
 * When the signature verifies, the embedded key is returned. When it does not,
 * the result is the hash of the digest and the signature, which is never the
 * key of a real signer. A digest that differs from the one that was signed
 * therefore recovers a different key, as with ECDSA public key recovery.
 *
 * Fails with crypto_errc::malformed_signature when the embedded key is not a
 * point on the curve.
 */
result< public_key_data > recover( const recoverable_signature& sig, const digest& dig ) noexcept;

} // namespace custodia::crypto
