#pragma once

#include <concepts>
#include <cstdint>
#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <tessera/math.hpp>
#include <tessera/protocol/account.hpp>
#include <tessera/protocol/error.hpp>

namespace tessera::protocol {

struct event
{
  std::uint64_t sequence = 0;
  std::string name;
  std::vector< std::byte > data;
  std::vector< account > impacted;
};

struct transfer_event
{
  static constexpr std::string_view name = "transfer";

  account from{};
  account to{};
  math::amount value;

  std::vector< account > impacted() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & to;
    ar & value;
  }
};

struct approval_event
{
  static constexpr std::string_view name = "approval";

  account owner{};
  account spender{};
  math::amount value;

  std::vector< account > impacted() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & owner;
    ar & spender;
    ar & value;
  }
};

struct mint_event
{
  static constexpr std::string_view name = "mint";

  account to{};
  math::amount amount;

  std::vector< account > impacted() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & to;
    ar & amount;
  }
};

struct burn_event
{
  static constexpr std::string_view name = "burn";

  account from{};
  math::amount amount;

  std::vector< account > impacted() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & from;
    ar & amount;
  }
};

struct mint_agent_changed_event
{
  static constexpr std::string_view name = "mint_agent_changed";

  account agent{};
  bool enabled = false;

  std::vector< account > impacted() const;

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & agent;
    ar & enabled;
  }
};

template< typename T >
concept Payload = requires( const T& t ) {
  { T::name } -> std::convertible_to< std::string_view >;
  { t.impacted() } -> std::same_as< std::vector< account > >;
};

constexpr auto archive_flags = boost::archive::no_header;

/**
 * Wraps a payload in an event record. The sequence number is assigned when
 * the event is committed to the ledger's log.
 */
template< Payload T >
event make_event( const T& payload )
{
  std::stringstream stream;
  {
    boost::archive::binary_oarchive archive( stream, archive_flags );
    archive << payload;
  }

  const auto bytes = stream.str();

  event ev;
  ev.name = std::string( T::name );
  ev.data.reserve( bytes.size() );
  for( char c: bytes )
    ev.data.push_back( static_cast< std::byte >( c ) );
  ev.impacted = payload.impacted();

  return ev;
}

template< Payload T >
result< T > decode( const event& ev )
{
  if( ev.name != T::name )
    return std::unexpected( protocol_errc::malformed_event );

  std::string bytes;
  bytes.reserve( ev.data.size() );
  for( auto b: ev.data )
    bytes.push_back( static_cast< char >( b ) );

  T payload;

  try
  {
    std::stringstream stream( bytes );
    boost::archive::binary_iarchive archive( stream, archive_flags );
    archive >> payload;
  }
  catch( const std::exception& )
  {
    return std::unexpected( protocol_errc::malformed_event );
  }

  return payload;
}

} // namespace tessera::protocol
