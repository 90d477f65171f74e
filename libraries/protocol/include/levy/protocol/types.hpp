/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <memory>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <cstdint>

#include <boost/multiprecision/cpp_int.hpp>

#include <fc/container/flat.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/static_variant.hpp>
#include <fc/string.hpp>
#include <fc/time.hpp>

#include <levy/protocol/object_id.hpp>
#include <levy/protocol/config.hpp>

namespace levy { namespace protocol {
using namespace levy::db;

using std::map;
using std::vector;
using std::string;
using std::deque;
using std::shared_ptr;
using std::unique_ptr;
using std::set;
using std::pair;

using fc::variant_object;
using fc::variant;
using fc::optional;
using fc::time_point_sec;
using fc::time_point;
using fc::flat_map;
using fc::flat_set;
using fc::static_variant;

/**
 * Amounts are unsigned 256 bit integers. Every operation on them is checked: an overflow, or a
 * subtraction that would go below zero, throws instead of wrapping.
 */
using share_type = boost::multiprecision::checked_uint256_t;

enum reserved_spaces {
    relative_protocol_ids = 0,
    protocol_ids          = 1,
    implementation_ids    = 2
};

/// Object types in the Protocol Space (1.x.x)
enum object_type {
    null_object_type              = 0,
    base_object_type              = 1,
    account_object_type           = 2,
    asset_object_type             = 3,
    operation_history_object_type = 11,
    liquidity_pool_object_type    = 19
};

/// Object types in the Implementation Space (2.x.x)
enum impl_object_type {
    impl_account_balance_object_type = 5,
    impl_allowance_object_type       = 22
};

using account_id_type           = object_id< protocol_ids, account_object_type >;
using asset_id_type             = object_id< protocol_ids, asset_object_type >;
using operation_history_id_type = object_id< protocol_ids, operation_history_object_type >;
using liquidity_pool_id_type    = object_id< protocol_ids, liquidity_pool_object_type >;

/// 10^decimals, the number of base units in one whole unit of an asset
share_type scaled_precision( uint8_t decimals );

/// the largest representable amount, used as the "unlimited" allowance
share_type max_share_amount();

} }  // levy::protocol

namespace fc {
void to_variant( const levy::protocol::share_type& var, fc::variant& vo, uint32_t max_depth = 1 );
void from_variant( const fc::variant& var, levy::protocol::share_type& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_ENUM( levy::protocol::object_type,
                 (null_object_type)
                 (base_object_type)
                 (account_object_type)
                 (asset_object_type)
                 (operation_history_object_type)
                 (liquidity_pool_object_type) )

FC_REFLECT_TYPENAME( levy::protocol::share_type )
