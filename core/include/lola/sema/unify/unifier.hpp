// lola/sema/unify/unifier.hpp - Union-find with snapshot/rollback
//
// Backs both type inference and pacing inference. Values attached to
// equivalence classes are combined through a merge function object; when the
// merge fails the unification reports a Conflict carrying both values.
//
// Every mutation made while a snapshot is open is recorded in an undo log, so
// rollback_to() restores the exact prior state (including path compression).
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace lola
{

/// Key of a unification variable. Only the Unifier owns the state behind it.
using VarId = uint32_t;

inline constexpr VarId k_no_var = UINT32_MAX;

/**
 * Merge customization point.
 *
 * Specializations provide
 *   std::optional<V> operator()(const V & a, const V & b) const;
 * returning the combined value or std::nullopt when a and b are incompatible.
 */
template <typename V>
struct UnifyValue;

template <typename V>
struct Conflict
{
  V left;
  V right;
};

template <typename V>
class UnifyResult
{
public:
  static UnifyResult success() { return UnifyResult{}; }

  static UnifyResult conflict(V left, V right)
  {
    UnifyResult r;
    r.conflict_ = Conflict<V>{std::move(left), std::move(right)};
    return r;
  }

  [[nodiscard]] bool ok() const noexcept { return !conflict_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }

  /// Only valid when !ok()
  [[nodiscard]] const Conflict<V> & get_conflict() const { return *conflict_; }

private:
  std::optional<Conflict<V>> conflict_;
};

/// Position in the undo log returned by Unifier::snapshot().
struct Mark
{
  size_t undo_length = 0;
};

template <typename V, typename Merge = UnifyValue<V>>
class Unifier
{
public:
  explicit Unifier(Merge merge = Merge{}) : merge_(std::move(merge)) {}

  /// Allocate a fresh variable bound to `value` (the unconstrained value by default).
  VarId new_var(V value = V{})
  {
    const auto id = static_cast<VarId>(entries_.size());
    entries_.push_back(Entry{id, 0, std::move(value)});
    if (in_snapshot()) {
      undo_log_.push_back(UndoEntry{id, std::nullopt});
    }
    return id;
  }

  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }

  /// Representative of the class containing `v` (compresses the path).
  VarId find(VarId v)
  {
    VarId root = v;
    while (entries_[root].parent != root) {
      root = entries_[root].parent;
    }
    while (entries_[v].parent != root) {
      const VarId next = entries_[v].parent;
      Entry e = entries_[v];
      e.parent = root;
      set_entry(v, std::move(e));
      v = next;
    }
    return root;
  }

  /// Current best-known value of the class containing `v`.
  const V & probe(VarId v) { return entries_[find(v)].value; }

  [[nodiscard]] bool unioned(VarId a, VarId b) { return find(a) == find(b); }

  /// Merge the classes of `a` and `b`.
  UnifyResult<V> unify_var_var(VarId a, VarId b)
  {
    VarId ra = find(a);
    VarId rb = find(b);
    if (ra == rb) {
      return UnifyResult<V>::success();
    }

    std::optional<V> merged = merge_(entries_[ra].value, entries_[rb].value);
    if (!merged) {
      return UnifyResult<V>::conflict(entries_[ra].value, entries_[rb].value);
    }

    if (entries_[ra].rank < entries_[rb].rank) {
      std::swap(ra, rb);
    }
    Entry child = entries_[rb];
    child.parent = ra;
    set_entry(rb, std::move(child));

    Entry root = entries_[ra];
    if (root.rank == entries_[rb].rank) {
      ++root.rank;
    }
    root.value = std::move(*merged);
    set_entry(ra, std::move(root));
    return UnifyResult<V>::success();
  }

  /// Merge `value` into the class of `a`.
  UnifyResult<V> unify_var_value(VarId a, const V & value)
  {
    const VarId ra = find(a);
    std::optional<V> merged = merge_(entries_[ra].value, value);
    if (!merged) {
      return UnifyResult<V>::conflict(entries_[ra].value, value);
    }
    Entry root = entries_[ra];
    root.value = std::move(*merged);
    set_entry(ra, std::move(root));
    return UnifyResult<V>::success();
  }

  // ===========================================================================
  // Speculation
  // ===========================================================================

  Mark snapshot()
  {
    ++open_snapshots_;
    return Mark{undo_log_.size()};
  }

  /// Undo everything recorded since `mark` and close the snapshot.
  void rollback_to(Mark mark)
  {
    while (undo_log_.size() > mark.undo_length) {
      UndoEntry undo = std::move(undo_log_.back());
      undo_log_.pop_back();
      if (undo.previous) {
        entries_[undo.var] = std::move(*undo.previous);
      } else {
        // Variables are created in order, so the newest one is last.
        entries_.pop_back();
      }
    }
    close_snapshot();
  }

  /// Keep everything recorded since `mark` and close the snapshot.
  void commit(Mark /*mark*/) { close_snapshot(); }

  [[nodiscard]] bool in_snapshot() const noexcept { return open_snapshots_ > 0; }

private:
  struct Entry
  {
    VarId parent;
    uint32_t rank;
    V value;
  };

  struct UndoEntry
  {
    VarId var;
    std::optional<Entry> previous;  ///< nullopt: the variable was created
  };

  void set_entry(VarId v, Entry e)
  {
    if (in_snapshot()) {
      undo_log_.push_back(UndoEntry{v, entries_[v]});
    }
    entries_[v] = std::move(e);
  }

  void close_snapshot()
  {
    if (open_snapshots_ > 0) {
      --open_snapshots_;
    }
    // Outermost snapshot closed: nothing can roll back past this point.
    if (open_snapshots_ == 0) {
      undo_log_.clear();
    }
  }

  Merge merge_;
  std::vector<Entry> entries_;
  std::vector<UndoEntry> undo_log_;
  size_t open_snapshots_ = 0;
};

}  // namespace lola
