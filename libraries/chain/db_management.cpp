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
#include <apogee/chain/database.hpp>

namespace apogee
{
namespace chain
{

database::database()
{
  initialize_evaluators();
}

database::~database()
{
}

undo_session::undo_session(ledger_state &state)
    : _state(state), _backup(state)
{
}

undo_session::undo_session(undo_session &&mv)
    : _state(mv._state), _backup(std::move(mv._backup)), _apply_undo(mv._apply_undo)
{
  mv._apply_undo = false;
}

undo_session::~undo_session()
{
  if (_apply_undo)
    undo();
}

void undo_session::undo()
{
  _state = std::move(_backup);
  _apply_undo = false;
}

operation_result database::apply_operation(const call_context &ctx, const operation &op)
{
  try
  {
    FC_ASSERT(_initialized, "the ledger has no genesis state");
    int i_which = op.which();
    uint64_t u_which = uint64_t(i_which);
    FC_ASSERT(i_which >= 0, "Negative operation tag in operation ${op}", ("op", op));
    FC_ASSERT(u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op", op));
    std::unique_ptr<op_evaluator> &eval = _operation_evaluators[u_which];
    FC_ASSERT(eval, "No registered evaluator for operation ${op}", ("op", op));

    _pending_events.clear();
    undo_session session(_state);
    operation_result result;
    try
    {
      result = eval->evaluate(*this, ctx, op);
    }
    catch (const fc::exception &e)
    {
      _pending_events.clear();
      wlog("operation failed at height ${h}: ${e}", ("h", ctx.height)("e", e.to_string()));
      throw;
    }
    catch (const std::exception &e)
    {
      _pending_events.clear();
      wlog("operation failed at height ${h}: ${e}", ("h", ctx.height)("e", e.what()));
      throw;
    }
    session.commit();

    _applied_events = std::move(_pending_events);
    _pending_events.clear();
    notify_applied_events();
    return result;
  }
  FC_CAPTURE_AND_RETHROW((ctx)(op))
}

} // namespace chain
} // namespace apogee
