// NOLINTBEGIN

#include <gtest/gtest.h>

#include <custodia/token.hpp>

#include <test/context.hpp>

using custodia::protocol::amount;
using custodia::token::token_errc;

TEST( ledger, mint_and_burn )
{
  test::context ctx;
  custodia::token::ledger ledger( ctx.system(), ctx._desc.self );

  auto alice = test::context::account( "alice" );

  EXPECT_EQ( ledger.total_supply().value(), 0 );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 0 );

  EXPECT_EQ( ledger.mint( alice, 100 ), token_errc::ok );
  EXPECT_EQ( ledger.total_supply().value(), 100 );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 100 );

  EXPECT_EQ( ledger.burn( alice, 101 ), token_errc::insufficient_balance );
  EXPECT_EQ( ledger.burn( alice, 40 ), token_errc::ok );
  EXPECT_EQ( ledger.total_supply().value(), 60 );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 60 );

  EXPECT_EQ( ledger.mint( custodia::protocol::null_account, 1 ), token_errc::invalid_recipient );
  EXPECT_EQ( ledger.burn( custodia::protocol::null_account, 1 ), token_errc::invalid_sender );

  ASSERT_EQ( ctx.events().size(), 2 );
  EXPECT_EQ( std::get< custodia::protocol::transfer_event >( ctx.events()[ 0 ].data ),
             ( custodia::protocol::transfer_event{ custodia::protocol::null_account, alice, 100 } ) );
  EXPECT_EQ( std::get< custodia::protocol::transfer_event >( ctx.events()[ 1 ].data ),
             ( custodia::protocol::transfer_event{ alice, custodia::protocol::null_account, 40 } ) );
  EXPECT_EQ( ctx.events()[ 1 ].sequence, 1 );
  EXPECT_EQ( ctx.events()[ 1 ].source, ctx._desc.self );
  ASSERT_EQ( ctx.events()[ 1 ].impacted.size(), 1 );
  EXPECT_EQ( ctx.events()[ 1 ].impacted[ 0 ], alice );
}

TEST( ledger, mint_zero )
{
  test::context ctx;
  custodia::token::ledger ledger( ctx.system(), ctx._desc.self );

  auto alice = test::context::account( "alice" );

  EXPECT_EQ( ledger.mint( alice, 0 ), token_errc::ok );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 0 );
  ASSERT_EQ( ctx.events().size(), 1 );
  EXPECT_EQ( std::get< custodia::protocol::transfer_event >( ctx.events()[ 0 ].data ).value, 0 );
}

TEST( ledger, mint_overflow )
{
  test::context ctx;
  custodia::token::ledger ledger( ctx.system(), ctx._desc.self );

  auto alice = test::context::account( "alice" );
  auto bob   = test::context::account( "bob" );

  EXPECT_EQ( ledger.mint( alice, custodia::protocol::max_amount ), token_errc::ok );
  EXPECT_EQ( ledger.mint( bob, 1 ), token_errc::overflow );
  EXPECT_EQ( ledger.balance_of( bob ).value(), 0 );
  EXPECT_EQ( ledger.total_supply().value(), custodia::protocol::max_amount );
}

TEST( ledger, transfer )
{
  test::context ctx;
  custodia::token::ledger ledger( ctx.system(), ctx._desc.self );

  auto alice = test::context::account( "alice" );
  auto bob   = test::context::account( "bob" );

  ASSERT_EQ( ledger.mint( alice, 100 ), token_errc::ok );

  EXPECT_EQ( ledger.transfer( alice, bob, 30 ), token_errc::ok );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 70 );
  EXPECT_EQ( ledger.balance_of( bob ).value(), 30 );
  EXPECT_EQ( ledger.total_supply().value(), 100 );

  EXPECT_EQ( ledger.transfer( alice, bob, 71 ), token_errc::insufficient_balance );
  EXPECT_EQ( ledger.transfer( custodia::protocol::null_account, bob, 1 ), token_errc::invalid_sender );
  EXPECT_EQ( ledger.transfer( alice, custodia::protocol::null_account, 1 ), token_errc::invalid_recipient );

  EXPECT_EQ( ledger.transfer( alice, alice, 70 ), token_errc::ok );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 70 );

  EXPECT_EQ( ledger.transfer( bob, alice, 30 ), token_errc::ok );
  EXPECT_EQ( ledger.balance_of( bob ).value(), 0 );
  EXPECT_EQ( ledger.balance_of( alice ).value(), 100 );
}

TEST( ledger, corrupt_balance )
{
  test::context ctx;
  custodia::token::ledger ledger( ctx.system(), ctx._desc.self );

  auto alice = test::context::account( "alice" );

  std::vector< std::byte > garbage{ std::byte{ 0x01 }, std::byte{ 0x02 } };
  ASSERT_FALSE( ctx.system().put_object( custodia::token::state::space::balance( ctx._desc.self ), alice, garbage ) );

  auto balance = ledger.balance_of( alice );
  ASSERT_FALSE( balance );
  EXPECT_EQ( balance.error(), token_errc::unexpected_object );
  EXPECT_EQ( ledger.transfer( alice, test::context::account( "bob" ), 1 ), token_errc::unexpected_object );
}

// NOLINTEND
