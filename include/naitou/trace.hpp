#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include "naitou/book.hpp"
#include "naitou/move.hpp"
#include "naitou/position.hpp"

namespace naitou {

struct RootEvaluation;
struct LeafEvaluation;

// Receives the steps of every COM decision, in order. Used to diff the
// replica against recorded runs of Naitou.
class TraceSink {
public:
  virtual ~TraceSink() = default;

  virtual void thinkStart(const Position& pos) = 0;
  virtual void progress(int ply, int level, int levelSub) = 0;
  virtual void formation(Formation f) = 0;
  virtual void rootEvaluation(const RootEvaluation& e) = 0;

  virtual void candidateStart(const Position& after, const Move& m) = 0;
  virtual void candidateRejected(std::string_view reason) = 0;
  // stage is "ini" before the revision rules run and "rev" after.
  virtual void leafEvaluation(std::string_view stage, const LeafEvaluation& e) = 0;
  // Called before the named rule changes the evaluation.
  virtual void revision(std::string_view rule, const LeafEvaluation& e) = 0;
  virtual void comparison(std::string_view rule, bool improved) = 0;
  virtual void best(std::optional<Move> m, const LeafEvaluation& e) = 0;
  virtual void candidateEnd() = 0;

  virtual void bookStart() = 0;
  virtual void bookAccept(const Move& m) = 0;

  // kind is "move", "com-win", "hum-win" or "hum-suicide".
  virtual void response(std::string_view kind, std::optional<Move> m) = 0;
  virtual void thinkEnd() = 0;
};

// Line-oriented text trace.
class TextTrace final : public TraceSink {
public:
  explicit TextTrace(std::ostream& os, bool verbose = true) : os_(os), verbose_(verbose) {}

  void thinkStart(const Position& pos) override;
  void progress(int ply, int level, int levelSub) override;
  void formation(Formation f) override;
  void rootEvaluation(const RootEvaluation& e) override;
  void candidateStart(const Position& after, const Move& m) override;
  void candidateRejected(std::string_view reason) override;
  void leafEvaluation(std::string_view stage, const LeafEvaluation& e) override;
  void revision(std::string_view rule, const LeafEvaluation& e) override;
  void comparison(std::string_view rule, bool improved) override;
  void best(std::optional<Move> m, const LeafEvaluation& e) override;
  void candidateEnd() override;
  void bookStart() override;
  void bookAccept(const Move& m) override;
  void response(std::string_view kind, std::optional<Move> m) override;
  void thinkEnd() override;

private:
  std::ostream& os_;
  bool verbose_; // boards and effect counts for every candidate
};

} // namespace naitou
