// NOLINTBEGIN

#include <gtest/gtest.h>

#include <custodia/controller.hpp>

#include <test/context.hpp>

using custodia::token::token_errc;

namespace {

custodia::state_db::object_space test_space()
{
  custodia::state_db::object_space space{};
  space.id = 42;
  return space;
}

const std::vector< std::byte > key{ std::byte{ 0x01 } };
const std::vector< std::byte > value{ std::byte{ 0x10 } };

bool exists( custodia::controller::execution_context& ctx )
{
  auto object = ctx.get_object( test_space(), key );
  return object && !object->empty();
}

} // namespace

TEST( execution_context, commit )
{
  test::context t;
  auto& ctx = *t._context;

  auto error = ctx.apply(
    [ & ]( custodia::controller::execution_context& system )
    {
      EXPECT_EQ( system.depth(), 1 );
      EXPECT_FALSE( system.put_object( test_space(), key, value ) );
      return system.event( custodia::protocol::deposit_event{ test::context::account( "alice" ), 1 } );
    } );

  EXPECT_EQ( error, token_errc::ok );
  EXPECT_EQ( ctx.depth(), 0 );
  EXPECT_TRUE( exists( ctx ) );
  EXPECT_EQ( t._db.root()->revision(), 1 );
  ASSERT_EQ( t.events().size(), 1 );
  EXPECT_EQ( t.events()[ 0 ].sequence, 0 );
}

TEST( execution_context, discard )
{
  test::context t;
  auto& ctx = *t._context;

  auto error = ctx.apply(
    [ & ]( custodia::controller::execution_context& system ) -> std::error_code
    {
      EXPECT_FALSE( system.put_object( test_space(), key, value ) );
      EXPECT_FALSE( system.event( custodia::protocol::deposit_event{ test::context::account( "alice" ), 1 } ) );
      EXPECT_TRUE( exists( system ) );
      return token_errc::insufficient_balance;
    } );

  EXPECT_EQ( error, token_errc::insufficient_balance );
  EXPECT_EQ( ctx.depth(), 0 );
  EXPECT_FALSE( exists( ctx ) );
  EXPECT_EQ( t._db.root()->revision(), 0 );
  EXPECT_TRUE( t.events().empty() );
}

TEST( execution_context, exception_discards )
{
  test::context t;
  auto& ctx = *t._context;

  EXPECT_THROW( ctx.apply(
                  [ & ]( custodia::controller::execution_context& system ) -> std::error_code
                  {
                    EXPECT_FALSE( system.put_object( test_space(), key, value ) );
                    throw std::runtime_error( "failure" );
                  } ),
                std::runtime_error );

  EXPECT_EQ( ctx.depth(), 0 );
  EXPECT_FALSE( exists( ctx ) );
}

TEST( execution_context, nested )
{
  test::context t;
  auto& ctx = *t._context;
  auto alice = test::context::account( "alice" );

  auto error = ctx.apply(
    [ & ]( custodia::controller::execution_context& outer ) -> std::error_code
    {
      EXPECT_FALSE( outer.put_object( test_space(), key, value ) );

      auto inner_error = outer.apply(
        [ & ]( custodia::controller::execution_context& inner ) -> std::error_code
        {
          EXPECT_EQ( inner.depth(), 2 );
          EXPECT_TRUE( exists( inner ) );
          EXPECT_FALSE( inner.remove_object( test_space(), key ) );
          EXPECT_FALSE( inner.event( custodia::protocol::deposit_event{ alice, 2 } ) );
          return token_errc::insufficient_funds;
        } );

      EXPECT_EQ( inner_error, token_errc::insufficient_funds );
      EXPECT_TRUE( exists( outer ) );

      inner_error = outer.apply(
        [ & ]( custodia::controller::execution_context& inner ) -> std::error_code
        {
          return inner.event( custodia::protocol::deposit_event{ alice, 3 } );
        } );

      EXPECT_EQ( inner_error, token_errc::ok );
      EXPECT_TRUE( t.events().empty() );

      return outer.event( custodia::protocol::deposit_event{ alice, 4 } );
    } );

  EXPECT_EQ( error, token_errc::ok );
  EXPECT_TRUE( exists( ctx ) );
  EXPECT_EQ( t._db.root()->revision(), 1 );

  ASSERT_EQ( t.events().size(), 2 );
  EXPECT_EQ( std::get< custodia::protocol::deposit_event >( t.events()[ 0 ].data ).value, 3 );
  EXPECT_EQ( std::get< custodia::protocol::deposit_event >( t.events()[ 1 ].data ).value, 4 );
  EXPECT_EQ( t.events()[ 1 ].sequence, 1 );
}

// NOLINTEND
