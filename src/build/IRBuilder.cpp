//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the IRBuilder helper.  The builder appends statements to the
// block selected by setInsertPoint and stamps every instruction with the
// current source location.  Misuse (emitting without a body or block) is a
// programming error and throws std::logic_error, mirroring the rest of the IR
// construction utilities.
//
//===----------------------------------------------------------------------===//

#include "build/IRBuilder.hpp"

#include <stdexcept>
#include <utility>

using namespace ember::ir;

namespace ember::build
{

IRBuilder::IRBuilder(Module &m) : module_(m) {}

Body &IRBuilder::startBody(const std::string &name,
                           TypeRef ret,
                           const std::vector<TypeRef> &args,
                           uint32_t typeParams)
{
    Body body;
    body.name = name;
    body.argCount = static_cast<uint32_t>(args.size());
    body.typeParamCount = typeParams;
    body.loc = loc_;
    body.locals.push_back(LocalDecl{ret, "ret"});
    for (size_t i = 0; i < args.size(); ++i)
        body.locals.push_back(LocalDecl{args[i], "arg" + std::to_string(i)});
    module_.bodies.push_back(std::move(body));
    body_ = &module_.bodies.back();
    current_ = 0;
    return *body_;
}

Local IRBuilder::addLocal(TypeRef type, std::string name)
{
    if (!body_)
        throw std::logic_error("addLocal without an active body");
    body_->locals.push_back(LocalDecl{type, std::move(name)});
    return static_cast<Local>(body_->locals.size() - 1);
}

BlockId IRBuilder::addBlock()
{
    if (!body_)
        throw std::logic_error("addBlock without an active body");
    body_->blocks.emplace_back();
    return static_cast<BlockId>(body_->blocks.size() - 1);
}

void IRBuilder::setInsertPoint(BlockId bb)
{
    if (!body_ || bb >= body_->blocks.size())
        throw std::logic_error("insert point outside the active body");
    current_ = bb;
}

void IRBuilder::setLoc(support::SourceLoc loc)
{
    loc_ = loc;
}

Operand IRBuilder::constInt(TypeRef type, int64_t value)
{
    return Operand::constantOf(type, static_cast<uint64_t>(value));
}

BasicBlock &IRBuilder::block()
{
    if (!body_ || current_ >= body_->blocks.size())
        throw std::logic_error("no insertion block");
    return body_->blocks[current_];
}

void IRBuilder::push(Statement stmt)
{
    stmt.loc = loc_;
    block().statements.push_back(std::move(stmt));
}

void IRBuilder::terminate(Terminator term)
{
    term.loc = loc_;
    block().terminator = std::move(term);
}

void IRBuilder::assign(const Place &dst, Rvalue rv)
{
    Statement s;
    s.kind = Statement::Kind::Assign;
    s.place = dst;
    s.rvalue = std::move(rv);
    push(std::move(s));
}

void IRBuilder::setDiscriminant(const Place &dst, uint32_t variant)
{
    Statement s;
    s.kind = Statement::Kind::SetDiscriminant;
    s.place = dst;
    s.variant = variant;
    push(std::move(s));
}

void IRBuilder::storageLive(Local local)
{
    Statement s;
    s.kind = Statement::Kind::StorageLive;
    s.local = local;
    push(std::move(s));
}

void IRBuilder::storageDead(Local local)
{
    Statement s;
    s.kind = Statement::Kind::StorageDead;
    s.local = local;
    push(std::move(s));
}

void IRBuilder::readForMatch(const Place &place)
{
    Statement s;
    s.kind = Statement::Kind::ReadForMatch;
    s.place = place;
    push(std::move(s));
}

void IRBuilder::validate(ValidationOp op, std::vector<ValidationOperand> operands)
{
    Statement s;
    s.kind = Statement::Kind::Validate;
    s.validationOp = op;
    s.validationOperands = std::move(operands);
    push(std::move(s));
}

void IRBuilder::endRegion(std::optional<uint32_t> region)
{
    Statement s;
    s.kind = Statement::Kind::EndRegion;
    s.region = region;
    push(std::move(s));
}

void IRBuilder::userAssertTy(const Place &place)
{
    Statement s;
    s.kind = Statement::Kind::UserAssertTy;
    s.place = place;
    push(std::move(s));
}

void IRBuilder::nop()
{
    Statement s;
    s.kind = Statement::Kind::Nop;
    push(std::move(s));
}

void IRBuilder::inlineAsm(std::string text)
{
    Statement s;
    s.kind = Statement::Kind::InlineAsm;
    s.asmText = std::move(text);
    push(std::move(s));
}

void IRBuilder::gotoBlock(BlockId target)
{
    Terminator t;
    t.kind = Terminator::Kind::Goto;
    t.target = target;
    terminate(std::move(t));
}

void IRBuilder::switchInt(Operand discr,
                          TypeRef type,
                          std::vector<uint64_t> values,
                          std::vector<BlockId> targets,
                          BlockId otherwise)
{
    if (values.size() != targets.size())
        throw std::logic_error("switchInt needs one target per value");
    Terminator t;
    t.kind = Terminator::Kind::SwitchInt;
    t.operand = std::move(discr);
    t.switchType = type;
    t.values = std::move(values);
    t.targets = std::move(targets);
    t.targets.push_back(otherwise);
    terminate(std::move(t));
}

void IRBuilder::ret()
{
    Terminator t;
    t.kind = Terminator::Kind::Return;
    terminate(std::move(t));
}

void IRBuilder::call(const std::string &callee,
                     std::vector<Operand> args,
                     std::optional<Place> dest,
                     std::optional<BlockId> target,
                     std::vector<TypeRef> substs)
{
    Terminator t;
    t.kind = Terminator::Kind::Call;
    t.callee = callee;
    t.args = std::move(args);
    t.destination = std::move(dest);
    t.target = target;
    t.substs = std::move(substs);
    terminate(std::move(t));
}

void IRBuilder::assertCond(Operand cond, bool expected, AssertMessage msg, BlockId target)
{
    Terminator t;
    t.kind = Terminator::Kind::Assert;
    t.operand = std::move(cond);
    t.expected = expected;
    t.msg = std::move(msg);
    t.target = target;
    terminate(std::move(t));
}

void IRBuilder::drop(const Place &place, BlockId target)
{
    Terminator t;
    t.kind = Terminator::Kind::Drop;
    t.place = place;
    t.target = target;
    terminate(std::move(t));
}

void IRBuilder::unreachable()
{
    Terminator t;
    t.kind = Terminator::Kind::Unreachable;
    terminate(std::move(t));
}

void IRBuilder::abort()
{
    Terminator t;
    t.kind = Terminator::Kind::Abort;
    terminate(std::move(t));
}

} // namespace ember::build
