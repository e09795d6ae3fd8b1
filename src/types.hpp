#pragma once

#include <boost/asio.hpp>
#include <boost/json.hpp>

namespace asio = boost::asio;
namespace json = boost::json;
