// NOLINTBEGIN

#include <gtest/gtest.h>

#include <custodia/controller/frame_guard.hpp>

#include <test/context.hpp>

#include <stdexcept>

TEST( frame_guard, commit )
{
  test::context t;
  std::vector< custodia::state_db::temporary_state_node_ptr > nodes;
  auto alice = test::context::account( "alice" );

  nodes.emplace_back( t._db.root()->make_child() );
  {
    custodia::controller::frame_guard guard( nodes, t._chronicler, t._chronicler.make_session() );
    t._chronicler.push_event( custodia::protocol::deposit_event{ alice, 1 } );
    EXPECT_TRUE( t.events().empty() );
    guard.commit();
  }

  EXPECT_TRUE( nodes.empty() );
  ASSERT_EQ( t.events().size(), 1 );
  EXPECT_EQ( t._db.root()->revision(), 1 );
}

TEST( frame_guard, failed_squash_discards_frame )
{
  test::context t;
  std::vector< custodia::state_db::temporary_state_node_ptr > nodes;
  auto alice = test::context::account( "alice" );

  nodes.emplace_back( t._db.root()->make_child() );
  {
    custodia::controller::frame_guard guard( nodes, t._chronicler, t._chronicler.make_session() );
    t._chronicler.push_event( custodia::protocol::deposit_event{ alice, 1 } );

    nodes.back()->squash();
    EXPECT_THROW( guard.commit(), std::runtime_error );
  }

  EXPECT_TRUE( nodes.empty() );
  EXPECT_TRUE( t.events().empty() );

  // The session of the failed frame is gone, so the next frame commits
  nodes.emplace_back( t._db.root()->make_child() );
  {
    custodia::controller::frame_guard guard( nodes, t._chronicler, t._chronicler.make_session() );
    t._chronicler.push_event( custodia::protocol::deposit_event{ alice, 2 } );
    EXPECT_NO_THROW( guard.commit() );
  }

  EXPECT_TRUE( nodes.empty() );
  ASSERT_EQ( t.events().size(), 1 );
  EXPECT_EQ( std::get< custodia::protocol::deposit_event >( t.events()[ 0 ].data ).value, 2 );
}

// NOLINTEND
