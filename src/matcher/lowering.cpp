#include "program.h"

namespace luxer {

namespace {

// Emits instructions for a tree into one program. Lookaround bodies become
// subprograms with their own registers.
class Lowering {
public:
  explicit Lowering(Program &program) : program(program) {}

  void emit(const PatternNode &node) {
    switch (node.type) {
    case PatternNodeType::TokenClass: {
      Instruction test(OpCode::Token);
      test.tokenType = node.tokenType;
      test.negated = node.negated;
      test.value = node.value;
      append(std::move(test));
      break;
    }
    case PatternNodeType::Literal: {
      Instruction test(OpCode::Token);
      test.anyType = true;
      test.value = node.value;
      append(std::move(test));
      break;
    }
    case PatternNodeType::Any: {
      Instruction test(OpCode::Token);
      test.anyType = true;
      append(std::move(test));
      break;
    }
    case PatternNodeType::Sequence:
      for (const auto &child : node.children) {
        emit(*child);
      }
      break;
    case PatternNodeType::Alternation:
      emitAlternation(node);
      break;
    case PatternNodeType::Group:
      if (node.captureIndex > 0) {
        emitSave(node.captureIndex * 2);
      }
      emit(*node.children.front());
      if (node.captureIndex > 0) {
        emitSave(node.captureIndex * 2 + 1);
      }
      break;
    case PatternNodeType::Quantifier:
      emitQuantifier(node);
      break;
    case PatternNodeType::Lookaround: {
      Program body;
      body.slotCount = program.slotCount;
      Lowering nested(body);
      nested.emit(*node.children.front());
      nested.append(Instruction(OpCode::Match));

      Instruction lookaround(OpCode::Lookaround);
      lookaround.subprogram = program.subprograms.size();
      lookaround.ahead = node.ahead;
      lookaround.positive = node.positive;
      program.subprograms.push_back(std::move(body));
      append(std::move(lookaround));
      break;
    }
    case PatternNodeType::Backreference: {
      Instruction reference(OpCode::Backreference);
      reference.group = node.referencedGroup;
      reference.depth = node.depth;
      reference.closeTag = node.closeTag;
      append(std::move(reference));
      break;
    }
    case PatternNodeType::Balanced: {
      Instruction balanced(OpCode::Balanced);
      balanced.open = node.openValue;
      balanced.close = node.closeValue;
      append(std::move(balanced));
      break;
    }
    case PatternNodeType::BalancedUntil: {
      Instruction until(OpCode::BalancedUntil);
      until.stops = node.stopValues;
      until.closers = node.closerValues;
      append(std::move(until));
      break;
    }
    case PatternNodeType::MarkupElement:
      append(Instruction(OpCode::MarkupElement));
      break;
    }
  }

  size_t append(Instruction instruction) {
    program.code.push_back(std::move(instruction));
    return program.code.size() - 1;
  }

private:
  Program &program;

  size_t here() const { return program.code.size(); }

  void emitSave(size_t slot) {
    Instruction save(OpCode::Save);
    save.slot = slot;
    append(std::move(save));
  }

  //     Split L1, N1
  // L1: first branch
  //     Jump end
  // N1: Split L2, N2
  //     ...
  //     last branch
  // end:
  void emitAlternation(const PatternNode &node) {
    std::vector<size_t> exits;
    for (size_t i = 0; i < node.children.size(); i++) {
      bool last = i + 1 == node.children.size();
      size_t split = 0;
      if (!last) {
        split = append(Instruction(OpCode::Split));
        program.code[split].target = here();
      }
      emit(*node.children[i]);
      if (!last) {
        exits.push_back(append(Instruction(OpCode::Jump)));
        program.code[split].alternative = here();
      }
    }
    for (size_t jump : exits) {
      program.code[jump].target = here();
    }
  }

  void emitQuantifier(const PatternNode &node) {
    const PatternNode &body = *node.children.front();

    // `?` needs no counter
    if (node.minCount == 0 && node.maxCount && *node.maxCount == 1) {
      size_t split = append(Instruction(OpCode::Split));
      size_t bodyStart = here();
      emit(body);
      size_t exit = here();
      program.code[split].target = node.greedy ? bodyStart : exit;
      program.code[split].alternative = node.greedy ? exit : bodyStart;
      return;
    }

    //       CounterInit c
    // loop: RepeatBranch c -> body | exit
    // body: ...
    //       RepeatEnd c -> loop
    // exit:
    size_t counter = program.registerCount++;
    size_t mark = program.registerCount++;

    Instruction init(OpCode::CounterInit);
    init.counter = counter;
    append(std::move(init));

    Instruction branch(OpCode::RepeatBranch);
    branch.counter = counter;
    branch.mark = mark;
    branch.minCount = node.minCount;
    branch.maxCount = node.maxCount;
    branch.greedy = node.greedy;
    size_t loop = append(std::move(branch));
    program.code[loop].target = here();

    emit(body);

    Instruction end(OpCode::RepeatEnd);
    end.counter = counter;
    end.mark = mark;
    end.minCount = node.minCount;
    end.target = loop;
    append(std::move(end));

    program.code[loop].alternative = here();
  }
};

} // namespace

Program lowerPattern(const CompiledPattern &pattern) {
  Program program;
  program.slotCount = (pattern.captureCount() + 1) * 2;

  Lowering lowering(program);
  Instruction start(OpCode::Save);
  start.slot = 0;
  lowering.append(std::move(start));
  lowering.emit(pattern.root());
  Instruction end(OpCode::Save);
  end.slot = 1;
  lowering.append(std::move(end));
  lowering.append(Instruction(OpCode::Match));
  return program;
}

} // namespace luxer
