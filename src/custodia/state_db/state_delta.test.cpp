// NOLINTBEGIN

#include <gtest/gtest.h>

#include <custodia/state_db/state_delta.hpp>
#include <custodia/state_db/types.hpp>

#include <algorithm>

TEST( state_delta, crud )
{
  auto delta = std::make_shared< custodia::state_db::state_delta >();
  ASSERT_TRUE( delta );

  EXPECT_EQ( delta->revision(), 0 );
  delta->set_revision( 1 );
  EXPECT_EQ( delta->revision(), 1 );

  EXPECT_TRUE( delta->root() );
  EXPECT_FALSE( delta->parent() );

  EXPECT_FALSE( delta->get( { std::byte{ 0x01 } } ) );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1 ), key_1.size() + value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > value_1a{ std::byte{ 0x10 }, std::byte{ 0x11 }, std::byte{ 0x12 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_1 ), value_1a ), value_1a.size() - value_1.size() );
  if( auto value = delta->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "delta did not return a value";

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 }, std::byte{ 0x21 } };
  EXPECT_EQ( delta->put( std::vector< std::byte >( key_2 ), value_2 ), key_2.size() + value_2.size() );

  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), -1 * ( key_1.size() + value_1a.size() ) );
  EXPECT_FALSE( delta->removed( key_1 ) );
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_EQ( delta->remove( std::vector< std::byte >( key_1 ) ), 0 );

  delta->clear();
  EXPECT_FALSE( delta->get( key_1 ) );
  EXPECT_FALSE( delta->get( key_2 ) );
}

TEST( state_delta, children )
{
  auto parent = std::make_shared< custodia::state_db::state_delta >();
  ASSERT_TRUE( parent );

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  parent->put( std::vector< std::byte >( key_1 ), value_1 );

  std::vector< std::byte > key_2{ std::byte{ 0x02 } }, value_2{ std::byte{ 0x20 } };
  parent->put( std::vector< std::byte >( key_2 ), value_2 );

  std::vector< std::byte > key_3{ std::byte{ 0x03 } }, value_3{ std::byte{ 0x30 } };

  auto child = parent->make_child();
  ASSERT_TRUE( child );
  EXPECT_FALSE( child->root() );
  EXPECT_EQ( &*parent, &*child->parent() );
  EXPECT_EQ( child->revision(), parent->revision() );

  // Reads fall through to the parent
  if( auto value = child->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "child did not return a parent value";

  std::vector< std::byte > value_1a{ std::byte{ 0x11 } };
  child->put( std::vector< std::byte >( key_1 ), value_1a );
  child->put( std::vector< std::byte >( key_3 ), value_3 );
  EXPECT_EQ( child->remove( std::vector< std::byte >( key_2 ) ), -1 * ( key_2.size() + value_2.size() ) );
  EXPECT_TRUE( child->removed( key_2 ) );

  EXPECT_FALSE( child->get( key_2 ) );
  EXPECT_TRUE( parent->get( key_2 ) );
  EXPECT_FALSE( parent->get( key_3 ) );

  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1 ) );
  else
    ADD_FAILURE() << "parent did not return a value";

  // Writing a removed key restores it
  child->put( std::vector< std::byte >( key_2 ), value_2 );
  EXPECT_FALSE( child->removed( key_2 ) );
  EXPECT_TRUE( child->get( key_2 ) );
  EXPECT_EQ( child->remove( std::vector< std::byte >( key_2 ) ), -1 * ( key_2.size() + value_2.size() ) );

  child->squash();
  EXPECT_EQ( parent->revision(), 1 );

  if( auto value = parent->get( key_1 ); value )
    EXPECT_TRUE( std::ranges::equal( *value, value_1a ) );
  else
    ADD_FAILURE() << "parent did not return the squashed value";

  EXPECT_FALSE( parent->get( key_2 ) );
  EXPECT_TRUE( parent->get( key_3 ) );

  EXPECT_THROW( parent->squash(), std::runtime_error );
}

TEST( state_delta, nested_squash )
{
  auto root   = std::make_shared< custodia::state_db::state_delta >();
  auto middle = root->make_child();
  auto leaf   = middle->make_child();

  std::vector< std::byte > key_1{ std::byte{ 0x01 } }, value_1{ std::byte{ 0x10 } };
  root->put( std::vector< std::byte >( key_1 ), value_1 );

  leaf->remove( std::vector< std::byte >( key_1 ) );
  EXPECT_FALSE( leaf->get( key_1 ) );
  EXPECT_TRUE( middle->get( key_1 ) );

  leaf->squash();
  EXPECT_TRUE( middle->removed( key_1 ) );
  EXPECT_FALSE( middle->get( key_1 ) );
  EXPECT_TRUE( root->get( key_1 ) );

  middle->squash();
  EXPECT_FALSE( root->get( key_1 ) );
  EXPECT_EQ( root->revision(), 1 );
}

// NOLINTEND
