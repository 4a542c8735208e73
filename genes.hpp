#ifndef GENES_H
#define GENES_H

#include "noveat.hpp"

namespace Noveat {
/*
Genes are keyed by their structural identity (T::Key, T::key()).
The identity is the map key, everything else is payload and never takes part
in membership tests.
*/
template <typename T> class Genes final {
public:
  using Key = typename T::Key;
  using Storage = std::map<Key, T>;
  using value_type = T;

  class iterator final {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T *;
    using reference = const T &;

    iterator() = default;
    explicit iterator(typename Storage::const_iterator it) : _it(it) {}

    reference operator*() const { return _it->second; }
    pointer operator->() const { return &_it->second; }

    iterator &operator++() {
      ++_it;
      return *this;
    }

    iterator operator++(int) {
      auto res = *this;
      ++_it;
      return res;
    }

    bool operator==(const iterator &other) const { return _it == other._it; }
    bool operator!=(const iterator &other) const { return _it != other._it; }

  private:
    typename Storage::const_iterator _it;
  };

  // Walks every gene exactly once, wrapping around from a start offset
  class RotatedView final {
  public:
    class iterator final {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = const T *;
      using reference = const T &;

      iterator(typename Storage::const_iterator it,
               typename Storage::const_iterator first,
               typename Storage::const_iterator last, size_t remaining)
          : _it(it), _first(first), _last(last), _remaining(remaining) {}

      reference operator*() const { return _it->second; }
      pointer operator->() const { return &_it->second; }

      iterator &operator++() {
        ++_it;
        if (_it == _last)
          _it = _first;
        _remaining--;
        return *this;
      }

      bool operator==(const iterator &other) const {
        return _remaining == other._remaining;
      }
      bool operator!=(const iterator &other) const {
        return _remaining != other._remaining;
      }

    private:
      typename Storage::const_iterator _it;
      typename Storage::const_iterator _first;
      typename Storage::const_iterator _last;
      size_t _remaining;
    };

    RotatedView(const Storage &storage, size_t offset)
        : _storage(storage), _offset(offset) {}

    iterator begin() const {
      return iterator(std::next(_storage.begin(), _offset), _storage.begin(),
                      _storage.end(), _storage.size());
    }

    iterator end() const {
      return iterator(_storage.end(), _storage.begin(), _storage.end(), 0);
    }

  private:
    const Storage &_storage;
    size_t _offset;
  };

  bool insert(const T &gene) { return _genes.emplace(gene.key(), gene).second; }

  void replace(const T &gene) { _genes[gene.key()] = gene; }

  bool contains(const Key &key) const { return _genes.count(key) != 0; }

  bool contains(const T &gene) const { return contains(gene.key()); }

  const T *get(const Key &key) const {
    auto it = _genes.find(key);
    if (it == _genes.end())
      return nullptr;
    return &it->second;
  }

  const T *random(Random &rng) const {
    if (_genes.empty())
      return nullptr;

    auto idx = rng.nextUInt() % _genes.size();
    return &std::next(_genes.begin(), idx)->second;
  }

  RotatedView iterateWithRandomOffset(Random &rng) const {
    auto offset = _genes.empty() ? 0 : rng.nextUInt() % _genes.size();
    return RotatedView(_genes, offset);
  }

  // matching genes are picked randomly
  // genes only we carry are kept, genes only `other` carries are dropped
  Genes crossIn(const Genes &other, Random &rng) const {
    Genes res;
    for (auto &[key, gene] : _genes) {
      auto oit = other._genes.find(key);
      if (oit != other._genes.end() && rng.nextDouble() < 0.5) {
        res._genes.emplace(key, oit->second);
      } else {
        res._genes.emplace(key, gene);
      }
    }
    return res;
  }

  iterator lowerBound(const Key &key) const {
    return iterator(_genes.lower_bound(key));
  }

  iterator begin() const { return iterator(_genes.begin()); }

  iterator end() const { return iterator(_genes.end()); }

  size_t size() const { return _genes.size(); }

  bool empty() const { return _genes.empty(); }

  template <class Archive>
  void save(Archive &ar, std::uint32_t const version) const {
    std::vector<T> genes;
    genes.reserve(_genes.size());
    for (auto &[_, gene] : _genes) {
      genes.push_back(gene);
    }
    ar(genes);
  }

  template <class Archive> void load(Archive &ar, std::uint32_t const version) {
    std::vector<T> genes;
    ar(genes);

    _genes.clear();
    for (auto &gene : genes) {
      if (!insert(gene))
        throw std::runtime_error("Archive contains two genes with the same "
                                 "identity.");
    }
  }

private:
  Storage _genes;
};
} // namespace Noveat

#endif /* GENES_H */
