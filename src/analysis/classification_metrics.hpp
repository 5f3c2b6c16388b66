#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

// ---------------------------------------------------------------------------
// BinaryMetrics — summary of probabilistic binary predictions
// ---------------------------------------------------------------------------
struct BinaryMetrics {
    double auc = std::nan("");
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    int true_positives = 0;
    int false_positives = 0;
    int true_negatives = 0;
    int false_negatives = 0;
};

// ROC AUC via the Mann-Whitney rank statistic with average ranks for ties.
// NaN when either class is absent.
inline double roc_auc(const std::vector<int>& labels, const std::vector<double>& scores) {
    if (labels.size() != scores.size()) {
        throw std::invalid_argument("roc_auc: labels.size() != scores.size()");
    }
    size_t n = labels.size();
    size_t n_pos = 0;
    for (int y : labels) if (y == 1) ++n_pos;
    size_t n_neg = n - n_pos;
    if (n_pos == 0 || n_neg == 0) return std::nan("");

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&](size_t a, size_t b) { return scores[a] < scores[b]; });

    double rank_sum_pos = 0.0;
    size_t i = 0;
    while (i < n) {
        size_t j = i;
        while (j + 1 < n && scores[order[j + 1]] == scores[order[i]]) ++j;
        double avg_rank = (static_cast<double>(i) + static_cast<double>(j)) / 2.0 + 1.0;
        for (size_t k = i; k <= j; ++k) {
            if (labels[order[k]] == 1) rank_sum_pos += avg_rank;
        }
        i = j + 1;
    }

    double np = static_cast<double>(n_pos);
    double nn = static_cast<double>(n_neg);
    return (rank_sum_pos - np * (np + 1.0) / 2.0) / (np * nn);
}

// Thresholded summary: predicted positive when score > cutoff.
// Precision and recall are 0 when their denominator is 0.
inline BinaryMetrics binary_metrics(const std::vector<int>& labels,
                                    const std::vector<double>& scores,
                                    double cutoff = 0.5) {
    BinaryMetrics m;
    m.auc = roc_auc(labels, scores);
    for (size_t i = 0; i < labels.size(); ++i) {
        bool pred = scores[i] > cutoff;
        bool truth = labels[i] == 1;
        if (pred && truth) ++m.true_positives;
        else if (pred && !truth) ++m.false_positives;
        else if (!pred && truth) ++m.false_negatives;
        else ++m.true_negatives;
    }
    int n = static_cast<int>(labels.size());
    if (n > 0) {
        m.accuracy = static_cast<double>(m.true_positives + m.true_negatives) / n;
    }
    int pred_pos = m.true_positives + m.false_positives;
    if (pred_pos > 0) m.precision = static_cast<double>(m.true_positives) / pred_pos;
    int actual_pos = m.true_positives + m.false_negatives;
    if (actual_pos > 0) m.recall = static_cast<double>(m.true_positives) / actual_pos;
    return m;
}
