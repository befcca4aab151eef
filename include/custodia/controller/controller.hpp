#pragma once

#include <custodia/controller/chronicler.hpp>
#include <custodia/controller/execution_context.hpp>
#include <custodia/controller/state.hpp>
#include <custodia/crypto.hpp>
#include <custodia/protocol.hpp>
#include <custodia/state_db.hpp>
#include <custodia/token.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>

namespace custodia::controller {

template< typename T >
using result = token::result< T >;

class controller
{
public:
  controller( const token::descriptor& desc, const std::shared_ptr< token::asset_escrow >& escrow );
  controller( const controller& ) = delete;
  controller( controller&& )      = delete;
  ~controller();

  controller& operator=( const controller& ) = delete;
  controller& operator=( controller&& )      = delete;

  void open( const state::genesis_data& data );
  void close();

  // Exchange of the native asset
  std::error_code deposit( const protocol::account& caller, const protocol::amount& value );
  std::error_code
  deposit_to( const protocol::account& caller, const protocol::account& recipient, const protocol::amount& value );
  std::error_code receive( const protocol::account& caller, const protocol::amount& value );
  std::error_code withdraw( const protocol::account& caller, const protocol::amount& value );
  std::error_code
  withdraw_to( const protocol::account& caller, const protocol::account& recipient, const protocol::amount& value );
  std::error_code withdraw_from( const protocol::account& caller,
                                 const protocol::account& owner,
                                 const protocol::account& recipient,
                                 const protocol::amount& value );

  // Movement of units
  std::error_code transfer( const protocol::account& caller, const protocol::account& to, const protocol::amount& value );
  std::error_code transfer_from( const protocol::account& caller,
                                 const protocol::account& from,
                                 const protocol::account& to,
                                 const protocol::amount& value );

  // Allowances
  std::error_code
  approve( const protocol::account& caller, const protocol::account& spender, const protocol::amount& value );
  std::error_code permit( const protocol::account& owner,
                          const protocol::account& spender,
                          const protocol::amount& value,
                          std::uint64_t deadline,
                          const crypto::recoverable_signature& signature,
                          std::uint64_t now );

  result< protocol::amount > balance_of( const protocol::account& account ) const;
  result< protocol::amount > allowance( const protocol::account& owner, const protocol::account& spender ) const;
  result< protocol::amount > total_supply() const;
  result< std::uint64_t > nonce_of( const protocol::account& owner ) const;
  result< protocol::amount > native_balance_of( const protocol::account& account ) const;

  result< crypto::digest > permit_digest( const protocol::account& owner,
                                          const protocol::account& spender,
                                          const protocol::amount& value,
                                          std::uint64_t deadline ) const;
  result< protocol::account > recover_signer( const protocol::account& owner,
                                              const protocol::account& spender,
                                              const protocol::amount& value,
                                              std::uint64_t deadline,
                                              const crypto::recoverable_signature& signature ) const;

  const std::string& name() const noexcept;
  const std::string& symbol() const noexcept;
  std::uint8_t decimals() const noexcept;
  crypto::digest domain_separator() const;
  const protocol::account& account() const noexcept;

  const std::vector< protocol::event >& events() const noexcept;
  std::uint64_t revision() const;

private:
  struct components;

  std::error_code run( std::string_view name, const std::function< std::error_code( components& ) >& op );

  template< typename T >
  result< T > read( const std::function< result< T >( components& ) >& query ) const;

  execution_context& context() const;

  token::descriptor _desc;
  std::shared_ptr< token::asset_escrow > _escrow;
  state_db::database _db;
  chronicler _chronicler;
  std::unique_ptr< execution_context > _context;
};

} // namespace custodia::controller
