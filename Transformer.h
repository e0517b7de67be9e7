#pragma once

#include <algorithm>
#include <concepts>
#include <ostream>
#include <utility>
#include <vector>

template <typename T>
class Transformer {
public:
    using Vec = std::vector<T>;

    explicit Transformer(Vec values)
        : m_values(std::move(values)) {

    }

    Transformer() = default;

    Vec const& get() const {
        return m_values;
    }

    template <std::invocable<T const&> Fn>
    Transformer transform(Fn f) const {
        Transformer t;
        t.m_values.reserve(m_values.size());
        for (auto const& value : m_values) {
            t.emplace(f(value));
        }
        return t;
    }

    template <std::predicate<T const&> Fn>
    Transformer filter(Fn f) const {
        Transformer t;
        for (auto const& value : m_values) {
            if (f(value)) {
                t.emplace(value);
            }
        }
        return t;
    }

    // keeps the first occurrence of every value
    Transformer removeDuplicates(std::ostream* trace = nullptr) const {
        if (m_values.size() < 2) {
            return *this;
        }

        Transformer t;
        for (auto const& value : m_values) {
            if (std::find(t.m_values.begin(), t.m_values.end(), value) == t.m_values.end()) {
                t.emplace(value);
            }
        }

        if (trace && t.m_values.size() != m_values.size()) {
            *trace << "OPT alt: " << m_values.size() - t.m_values.size() << std::endl;
        }

        return t;
    }

private:
    void emplace(T value) {
        m_values.push_back(std::move(value));
    }

    Vec m_values;
};
