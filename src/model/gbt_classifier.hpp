#pragma once

#include <xgboost/c_api.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GBTParams — fixed booster hyperparameters and the early-stopping rule
// ---------------------------------------------------------------------------
struct GBTParams {
    int max_rounds = 2000;
    int early_stopping_rounds = 50;
    double learning_rate = 0.05;
    int max_depth = 6;
    double subsample = 0.9;
    double colsample_bytree = 0.9;
    double min_child_weight = 1.0;
    double reg_alpha = 0.1;
    double reg_lambda = 0.1;
    int seed = 42;
    int nthread = 1;
};

// ---------------------------------------------------------------------------
// FeatureMatrix — dense row-major float matrix, NaN = missing
// ---------------------------------------------------------------------------
struct FeatureMatrix {
    std::vector<float> values;
    size_t rows = 0;
    size_t cols = 0;

    float at(size_t r, size_t c) const { return values[r * cols + c]; }
};

// ---------------------------------------------------------------------------
// GBTFitResult — what happened during boosting
// ---------------------------------------------------------------------------
struct GBTFitResult {
    std::string eval_metric;
    int rounds_trained = 0;
    int best_iteration = -1;       // 0-based round with the best validation score
    int iterations_used = 0;       // trees used for inference
    bool early_stopped = false;
    double best_score = std::nan("");
    std::vector<double> validation_curve;
};

// ---------------------------------------------------------------------------
// GBTClassifier — XGBoost C API wrapper for binary classification with
// validation-based early stopping
// ---------------------------------------------------------------------------
class GBTClassifier {
public:
    GBTClassifier() : booster_(nullptr) {}
    explicit GBTClassifier(const GBTParams& params) : params_(params), booster_(nullptr) {}

    ~GBTClassifier() {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }
    }

    // Non-copyable
    GBTClassifier(const GBTClassifier&) = delete;
    GBTClassifier& operator=(const GBTClassifier&) = delete;

    // Move semantics
    GBTClassifier(GBTClassifier&& other) noexcept
        : params_(other.params_), booster_(other.booster_) {
        other.booster_ = nullptr;
    }
    GBTClassifier& operator=(GBTClassifier&& other) noexcept {
        if (this != &other) {
            if (booster_) XGBoosterFree(booster_);
            params_ = other.params_;
            booster_ = other.booster_;
            other.booster_ = nullptr;
        }
        return *this;
    }

    const GBTParams& params() const { return params_; }
    bool is_trained() const { return booster_ != nullptr; }

    // Train on `train`, scoring `valid` after every round. Once
    // early_stopping_rounds pass without improvement boosting stops and the
    // booster is truncated to the best round. If the patience window never
    // runs out, all max_rounds rounds are kept.
    GBTFitResult fit(const FeatureMatrix& train, const std::vector<int>& train_labels,
                     const FeatureMatrix& valid, const std::vector<int>& valid_labels,
                     double scale_pos_weight,
                     const std::vector<std::string>& feature_names = {}) {
        if (train.rows == 0 || valid.rows == 0) {
            throw std::invalid_argument("Training and validation data must not be empty");
        }
        if (train.rows != train_labels.size() || valid.rows != valid_labels.size()) {
            throw std::invalid_argument("Feature rows != label count");
        }
        if (train.cols != valid.cols) {
            throw std::invalid_argument("Train/valid feature count mismatch");
        }
        if (params_.max_rounds <= 0) {
            throw std::invalid_argument("max_rounds must be > 0");
        }

        auto dtrain = make_dmatrix(train, feature_names);
        auto dvalid = make_dmatrix(valid, feature_names);
        set_labels(dtrain.handle, train_labels);
        set_labels(dvalid.handle, valid_labels);

        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }

        DMatrixHandle cache[] = {dtrain.handle, dvalid.handle};
        check(XGBoosterCreate(cache, 2, &booster_));

        GBTFitResult result;
        result.eval_metric = has_both_classes(valid_labels) ? "auc" : "logloss";
        const bool maximize = result.eval_metric == "auc";

        check(XGBoosterSetParam(booster_, "objective", "binary:logistic"));
        check(XGBoosterSetParam(booster_, "eval_metric", result.eval_metric.c_str()));
        check(XGBoosterSetParam(booster_, "learning_rate", to_param(params_.learning_rate).c_str()));
        check(XGBoosterSetParam(booster_, "max_depth", std::to_string(params_.max_depth).c_str()));
        check(XGBoosterSetParam(booster_, "subsample", to_param(params_.subsample).c_str()));
        check(XGBoosterSetParam(booster_, "colsample_bytree", to_param(params_.colsample_bytree).c_str()));
        check(XGBoosterSetParam(booster_, "min_child_weight", to_param(params_.min_child_weight).c_str()));
        check(XGBoosterSetParam(booster_, "alpha", to_param(params_.reg_alpha).c_str()));
        check(XGBoosterSetParam(booster_, "lambda", to_param(params_.reg_lambda).c_str()));
        check(XGBoosterSetParam(booster_, "scale_pos_weight", to_param(scale_pos_weight).c_str()));
        check(XGBoosterSetParam(booster_, "seed", std::to_string(params_.seed).c_str()));
        check(XGBoosterSetParam(booster_, "nthread", std::to_string(params_.nthread).c_str()));
        check(XGBoosterSetParam(booster_, "verbosity", "0"));

        DMatrixHandle eval_sets[] = {dvalid.handle};
        const char* eval_names[] = {"valid"};
        const std::string key = "valid-" + result.eval_metric + ":";

        for (int i = 0; i < params_.max_rounds; ++i) {
            check(XGBoosterUpdateOneIter(booster_, i, dtrain.handle));
            result.rounds_trained = i + 1;

            const char* eval_out = nullptr;
            check(XGBoosterEvalOneIter(booster_, i, eval_sets, eval_names, 1, &eval_out));
            double score = parse_eval_score(eval_out ? eval_out : "", key);
            result.validation_curve.push_back(score);

            if (std::isfinite(score) &&
                (result.best_iteration < 0 || !std::isfinite(result.best_score) ||
                 (maximize ? score > result.best_score : score < result.best_score))) {
                result.best_score = score;
                result.best_iteration = i;
            }
            int since_best = result.best_iteration < 0 ? i + 1 : i - result.best_iteration;
            if (params_.early_stopping_rounds > 0 && since_best >= params_.early_stopping_rounds) {
                result.early_stopped = true;
                break;
            }
        }

        if (result.early_stopped && result.best_iteration >= 0) {
            result.iterations_used = result.best_iteration + 1;
            truncate(result.iterations_used);
        } else {
            result.iterations_used = result.rounds_trained;
        }
        return result;
    }

    // Positive-class probability per row.
    std::vector<double> predict_proba(const FeatureMatrix& features) const {
        if (!booster_) {
            throw std::runtime_error("Model not trained - call fit() or load() first");
        }
        if (features.rows == 0) return {};

        auto dmat = make_dmatrix(features, {});
        const char* config =
            "{\"type\": 0, \"training\": false, \"iteration_begin\": 0, "
            "\"iteration_end\": 0, \"strict_shape\": false}";
        const bst_ulong* out_shape = nullptr;
        bst_ulong out_dim = 0;
        const float* out_result = nullptr;
        check(XGBoosterPredictFromDMatrix(booster_, dmat.handle, config,
                                          &out_shape, &out_dim, &out_result));

        std::vector<double> proba(features.rows);
        for (size_t i = 0; i < features.rows; ++i) {
            proba[i] = static_cast<double>(out_result[i]);
        }
        return proba;
    }

    int boosted_rounds() const {
        if (!booster_) return 0;
        int rounds = 0;
        check(XGBoosterBoostedRounds(booster_, &rounds));
        return rounds;
    }

    // Total gain per feature, in the order of `feature_names`. Features the
    // trees never split on get 0.
    std::vector<double> feature_importance(const std::vector<std::string>& feature_names) const {
        if (!booster_) {
            throw std::runtime_error("Model not trained - call fit() or load() first");
        }
        std::vector<double> importance(feature_names.size(), 0.0);

        const char* config = "{\"importance_type\": \"total_gain\", \"feature_map\": \"\"}";
        bst_ulong n_out = 0;
        const char** out_features = nullptr;
        bst_ulong out_dim = 0;
        const bst_ulong* out_shape = nullptr;
        const float* out_scores = nullptr;
        check(XGBoosterFeatureScore(booster_, config, &n_out, &out_features,
                                    &out_dim, &out_shape, &out_scores));

        std::map<std::string, size_t> index;
        for (size_t i = 0; i < feature_names.size(); ++i) {
            index[feature_names[i]] = i;
            index["f" + std::to_string(i)] = i;  // booster trained without names
        }
        for (bst_ulong k = 0; k < n_out; ++k) {
            auto it = index.find(out_features[k]);
            if (it != index.end()) importance[it->second] = static_cast<double>(out_scores[k]);
        }
        return importance;
    }

    void save(const std::string& path) const {
        if (!booster_) {
            throw std::runtime_error("No model to save");
        }
        int rc = XGBoosterSaveModel(booster_, path.c_str());
        if (rc != 0) {
            throw std::runtime_error("Failed to save model to: " + path);
        }
    }

    void load(const std::string& path) {
        if (booster_) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
        }

        check(XGBoosterCreate(nullptr, 0, &booster_));

        int rc = XGBoosterLoadModel(booster_, path.c_str());
        if (rc != 0) {
            XGBoosterFree(booster_);
            booster_ = nullptr;
            throw std::runtime_error("Failed to load model from: " + path);
        }
    }

    static FeatureMatrix make_matrix(const std::vector<std::vector<float>>& rows) {
        FeatureMatrix m;
        m.rows = rows.size();
        m.cols = rows.empty() ? 0 : rows.front().size();
        m.values.reserve(m.rows * m.cols);
        for (const auto& r : rows) {
            if (r.size() != m.cols) throw std::invalid_argument("Ragged feature rows");
            m.values.insert(m.values.end(), r.begin(), r.end());
        }
        return m;
    }

private:
    GBTParams params_;
    BoosterHandle booster_;

    // RAII guard for DMatrixHandle — prevents leaks on exception
    struct DMatrixGuard {
        DMatrixHandle handle = nullptr;
        explicit DMatrixGuard(DMatrixHandle h) : handle(h) {}
        ~DMatrixGuard() { if (handle) XGDMatrixFree(handle); }
        DMatrixGuard(DMatrixGuard&& o) noexcept : handle(o.handle) { o.handle = nullptr; }
        DMatrixGuard(const DMatrixGuard&) = delete;
        DMatrixGuard& operator=(const DMatrixGuard&) = delete;
    };

    static DMatrixGuard make_dmatrix(const FeatureMatrix& m,
                                     const std::vector<std::string>& feature_names) {
        DMatrixHandle dmat;
        check(XGDMatrixCreateFromMat(m.values.data(), static_cast<bst_ulong>(m.rows),
                                     static_cast<bst_ulong>(m.cols),
                                     std::numeric_limits<float>::quiet_NaN(), &dmat));
        DMatrixGuard guard(dmat);
        if (!feature_names.empty()) {
            if (feature_names.size() != m.cols) {
                throw std::invalid_argument("feature_names.size() != feature count");
            }
            std::vector<const char*> names;
            for (const auto& n : feature_names) names.push_back(n.c_str());
            check(XGDMatrixSetStrFeatureInfo(guard.handle, "feature_name", names.data(),
                                             static_cast<bst_ulong>(names.size())));
        }
        return guard;
    }

    static void set_labels(DMatrixHandle dmat, const std::vector<int>& labels) {
        std::vector<float> flabels(labels.size());
        for (size_t i = 0; i < labels.size(); ++i) flabels[i] = static_cast<float>(labels[i]);
        check(XGDMatrixSetFloatInfo(dmat, "label", flabels.data(),
                                    static_cast<bst_ulong>(flabels.size())));
    }

    static bool has_both_classes(const std::vector<int>& labels) {
        bool pos = false, neg = false;
        for (int y : labels) {
            if (y == 1) pos = true; else neg = true;
        }
        return pos && neg;
    }

    // "[12]\tvalid-auc:0.712345" -> 0.712345; NaN if the key is absent.
    static double parse_eval_score(const std::string& eval, const std::string& key) {
        size_t pos = eval.find(key);
        if (pos == std::string::npos) return std::nan("");
        const char* start = eval.c_str() + pos + key.size();
        char* end = nullptr;
        double v = std::strtod(start, &end);
        if (end == start) return std::nan("");
        return v;
    }

    // Keep only the first `rounds` trees.
    void truncate(int rounds) {
        if (rounds >= boosted_rounds()) return;
        BoosterHandle sliced = nullptr;
        check(XGBoosterSlice(booster_, 0, rounds, 1, &sliced));
        XGBoosterFree(booster_);
        booster_ = sliced;
    }

    static std::string to_param(double v) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.17g", v);
        return buf;
    }

    static void check(int rc) {
        if (rc != 0) {
            throw std::runtime_error(std::string("XGBoost error: ") + XGBGetLastError());
        }
    }
};
