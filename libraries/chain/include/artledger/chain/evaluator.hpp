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

#include <artledger/protocol/ledger_ops.hpp>

namespace artledger {
   namespace chain {
      class database;

      using protocol::operation;
      using protocol::operation_result;
      using protocol::void_result;

      class op_evaluator {
      public:
         virtual ~op_evaluator() {}

         virtual operation_result evaluate(database& db, const operation& op) const = 0;
      };

      template<typename T>
      class op_evaluator_impl : public op_evaluator {
      public:
         operation_result evaluate(database& db, const operation& o) const override {
            T eval(db);
            return eval.start_evaluate(o.get<typename T::operation_type>());
         }
      };

      /**
       * @brief Base of every evaluator
       *
       * do_evaluate() performs every check and must not modify the database.  do_apply() performs
       * the mutations and runs only after do_evaluate() succeeded.
       */
      template<typename DerivedEvaluator>
      class evaluator {
      public:
         explicit evaluator(database& d) : _db(d) {}

         template<typename OperationType>
         operation_result start_evaluate(const OperationType& op) {
            auto* eval = static_cast<DerivedEvaluator*>(this);
            eval->do_evaluate(op);
            return eval->do_apply(op);
         }

         database& db() const { return _db; }

      private:
         database& _db;
      };
   }
}
