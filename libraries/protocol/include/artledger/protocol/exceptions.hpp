/*
 * Copyright (c) 2023 Michel Santos and contributors.
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

#include <fc/exception/exception.hpp>

#define ARTLEDGER_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace artledger {
   namespace protocol {

      FC_DECLARE_EXCEPTION( ledger_exception, 3000000 )

      /// A null identity was supplied where a real owner or recipient is required
      FC_DECLARE_DERIVED_EXCEPTION( invalid_address_exception,      ledger_exception, 3010000 )
      /// The referenced token has never been minted
      FC_DECLARE_DERIVED_EXCEPTION( token_not_found_exception,      ledger_exception, 3020000 )
      /// Self-approval, or approval of the current owner
      FC_DECLARE_DERIVED_EXCEPTION( invalid_approval_exception,     ledger_exception, 3030000 )
      /// The caller is neither owner, delegate nor approved operator
      FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,         ledger_exception, 3040000 )
      /// The stated sender does not hold the token
      FC_DECLARE_DERIVED_EXCEPTION( ownership_mismatch_exception,   ledger_exception, 3050000 )
      /// A code-bearing recipient failed to acknowledge a safe transfer
      FC_DECLARE_DERIVED_EXCEPTION( receiver_rejected_exception,    ledger_exception, 3060000 )

   }
} // artledger::protocol
