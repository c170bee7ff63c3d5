#pragma once

#include <QString>
#include <QStringList>

#include <vector>

namespace dq {

// Configuration for the Chunker. Sizes are measured in words.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int chunkSize = 500;
    int overlap = 50;
};

// Chunker -- splits normalized document text into overlapping passages.
//
// Whitespace is collapsed first. Sentences are accumulated into a running
// buffer; when the next sentence would push the buffer past chunkSize words
// and the buffer is non-empty, the buffer is emitted and the next buffer is
// seeded with the last `overlap` words of the emitted chunk. A sentence that
// alone exceeds chunkSize is fed in word by word.
//
// Adjacent chunks therefore share exactly `overlap` words. Text shorter than
// chunkSize yields one chunk; empty or whitespace-only text yields none.
// Pure function of its inputs.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<QString> split(const QString& text) const;

    const Config& config() const { return m_config; }

private:
    std::vector<QStringList> segmentUnits(const QString& normalized) const;

    Config m_config;
};

} // namespace dq
