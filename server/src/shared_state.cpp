//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <utility>

#include "config.hpp"
#include "services/broadcast_hub.hpp"
#include "services/message_store.hpp"
#include "services/messaging_service.hpp"
#include "services/mysql_client.hpp"
#include "services/redis_client.hpp"
#include "services/session_registry.hpp"

using namespace msghub;

shared_state::shared_state(server_config config, boost::asio::any_io_executor ex)
    : impl_{
          std::move(config),
          nullptr,
          nullptr,
          nullptr,
          nullptr,
          nullptr,
          nullptr,
      }
{
    const auto& cfg = impl_.config_;
    session_policy policy{cfg.session_idle_timeout};

    impl_.store_ = create_message_store(cfg.db_path);
    impl_.hub_ = create_broadcast_hub(ex, cfg.hub_capacity);
    impl_.mysql_ = create_mysql_client(ex, cfg.mysql);
    impl_.redis_ = create_redis_client(ex, cfg.redis_host);
    impl_.sessions_ = create_redis_session_registry(*impl_.redis_, policy);
    impl_.messaging_ = std::make_unique<messaging_service>(store(), mysql(), hub());
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
