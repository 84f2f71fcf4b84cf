//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the IRBuilder class, which provides a high-level API for
// constructing Ember IR bodies programmatically.  Hosts that lower a front end
// into the IR, and the test-suite, use it instead of filling the structs by
// hand.
//
// The builder manages an insertion point (current block of the current body)
// and a current source location that is stamped on every emitted statement
// and terminator.
//
// Typical Usage Pattern:
//   Module m;
//   IRBuilder b(m);
//   auto &body = b.startBody("answer", m.types.intTy(32), {});
//   auto entry = b.addBlock();
//   b.setInsertPoint(entry);
//   b.assign(Place::fromLocal(0), Rvalue::use(b.constInt(m.types.intTy(32), 42)));
//   b.ret();
//
// The IRBuilder does NOT own the Module it operates on.  The caller must ensure
// the Module outlives all builder operations.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Body.hpp"
#include "ir/Instr.hpp"
#include "ir/Module.hpp"
#include "support/source_location.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ember::build
{

/// @brief Helper to construct IR bodies and enforce block termination.
class IRBuilder
{
  public:
    /// @brief Create builder operating on module @p m.
    explicit IRBuilder(ir::Module &m);

    /// @brief Begin definition of body @p name.
    /// @param ret Return type; becomes local 0.
    /// @param args Argument types; become locals 1..n.
    /// @param typeParams Number of generic parameters the body declares.
    /// @return Reference to the created body.
    ir::Body &startBody(const std::string &name,
                        ir::TypeRef ret,
                        const std::vector<ir::TypeRef> &args,
                        uint32_t typeParams = 0);

    /// @brief Declare a fresh local in the current body.
    ir::Local addLocal(ir::TypeRef type, std::string name = {});

    /// @brief Append an empty block to the current body.
    /// @return Index of the new block.
    ir::BlockId addBlock();

    /// @brief Direct subsequent emission into block @p bb.
    void setInsertPoint(ir::BlockId bb);

    /// @brief Source location attached to subsequently emitted instructions.
    void setLoc(support::SourceLoc loc);

    /// @brief Build an integer or bool constant operand of type @p type.
    static ir::Operand constInt(ir::TypeRef type, int64_t value);

    // Statements ------------------------------------------------------------
    void assign(const ir::Place &dst, ir::Rvalue rv);
    void setDiscriminant(const ir::Place &dst, uint32_t variant);
    void storageLive(ir::Local local);
    void storageDead(ir::Local local);
    void readForMatch(const ir::Place &place);
    void validate(ir::ValidationOp op, std::vector<ir::ValidationOperand> operands);
    void endRegion(std::optional<uint32_t> region);
    void userAssertTy(const ir::Place &place);
    void nop();
    void inlineAsm(std::string text);

    // Terminators -----------------------------------------------------------
    void gotoBlock(ir::BlockId target);
    void switchInt(ir::Operand discr,
                   ir::TypeRef type,
                   std::vector<uint64_t> values,
                   std::vector<ir::BlockId> targets,
                   ir::BlockId otherwise);
    void ret();
    void call(const std::string &callee,
              std::vector<ir::Operand> args,
              std::optional<ir::Place> dest,
              std::optional<ir::BlockId> target,
              std::vector<ir::TypeRef> substs = {});
    void assertCond(ir::Operand cond, bool expected, ir::AssertMessage msg, ir::BlockId target);
    void drop(const ir::Place &place, ir::BlockId target);
    void unreachable();
    void abort();

  private:
    ir::BasicBlock &block();
    void push(ir::Statement stmt);
    void terminate(ir::Terminator term);

    ir::Module &module_;
    ir::Body *body_ = nullptr;
    ir::BlockId current_ = 0;
    support::SourceLoc loc_{};
};

} // namespace ember::build
