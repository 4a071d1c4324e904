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
#include <artledger/protocol/exceptions.hpp>

namespace artledger {
   namespace protocol {

      FC_IMPLEMENT_EXCEPTION( ledger_exception, 3000000, "ledger exception" )

      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_address_exception,    ledger_exception, 3010000,
                                      "invalid address" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( token_not_found_exception,    ledger_exception, 3020000,
                                      "token not found" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_approval_exception,   ledger_exception, 3030000,
                                      "invalid approval" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,       ledger_exception, 3040000,
                                      "unauthorized" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( ownership_mismatch_exception, ledger_exception, 3050000,
                                      "ownership mismatch" )
      FC_IMPLEMENT_DERIVED_EXCEPTION( receiver_rejected_exception,  ledger_exception, 3060000,
                                      "receiver rejected" )

   }
} // artledger::protocol
