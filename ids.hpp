#ifndef IDS_H
#define IDS_H

#include "noveat.hpp"

namespace Noveat {
class IdGenerator final {
public:
  Id nextId() { return _next++; }

  // The index-th node id ever handed out for splitting `connection`.
  // Genomes splitting the same connection walk the same sequence so they end
  // up with matching hidden node ids.
  Id cachedId(const ConnectionKey &connection, size_t index) {
    auto &ids = _splitCache[connection];
    while (ids.size() <= index) {
      ids.push_back(nextId());
    }
    return ids[index];
  }

  Id peek() const { return _next; }

  size_t cachedSplits() const { return _splitCache.size(); }

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(_next, _splitCache);
  }

private:
  Id _next = 0;
  std::map<ConnectionKey, std::vector<Id>> _splitCache;
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::IdGenerator, NOVEAT_VERSION);

#endif /* IDS_H */
