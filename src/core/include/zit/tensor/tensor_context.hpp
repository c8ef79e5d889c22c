/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/allocator.hpp"
#include "zit/tensor/backend.hpp"
#include "zit/tensor/containers.hpp"
#include "zit/tensor/tensor_functors.hpp"
#include <concepts>
#include <string_view>
#include <utility>
#include <vector>

namespace zit::core {

    // Binds an allocator and a backend chosen at compile time. Allocating operations
    // create a result shaped like their output and delegate to the *_with_out form;
    // the result is released if that call throws.
    template <Backend B>
    class TensorContext {
    public:
        using backend_type = B;

        explicit TensorContext(B backend, Allocator& allocator = default_allocator())
            : backend_(std::move(backend)),
              allocator_(&allocator) {}

        B& backend() noexcept { return backend_; }
        const B& backend() const noexcept { return backend_; }
        Allocator& allocator() const noexcept { return *allocator_; }
        static constexpr std::string_view backend_name() { return B::name(); }

        // ============= Factories =============

        template <Numeric T>
        Tensor<T> tensor_init(std::vector<size_t> shape) const {
            return Tensor<T>::init(std::move(shape), *allocator_);
        }

        template <Numeric T>
        Tensor<T> tensor_zeros(std::vector<size_t> shape) const {
            return Tensor<T>::zeros(std::move(shape), *allocator_);
        }

        template <Numeric T>
        Tensor<T> tensor_splat(std::vector<size_t> shape, const T value) const {
            return Tensor<T>::splat(std::move(shape), value, *allocator_);
        }

        template <Numeric T>
        Tensor<T> tensor_from_data(const std::vector<T>& values, std::vector<size_t> shape) const {
            return Tensor<T>::from_data(values, std::move(shape), *allocator_);
        }

        template <Numeric T>
        Matrix<T> matrix_init(const size_t rows, const size_t columns) const {
            return Matrix<T>::init(rows, columns, *allocator_);
        }

        template <Numeric T>
        Matrix<T> matrix_zeros(const size_t rows, const size_t columns) const {
            return Matrix<T>::zeros(rows, columns, *allocator_);
        }

        template <Numeric T>
        Matrix<T> matrix_splat(const size_t rows, const size_t columns, const T value) const {
            return Matrix<T>::splat(rows, columns, value, *allocator_);
        }

        template <Numeric T>
        Matrix<T> matrix_from_data(const std::vector<T>& values, const size_t rows, const size_t columns) const {
            return Matrix<T>::from_data(values, rows, columns, *allocator_);
        }

        template <Numeric T>
        Vector<T> vector_init(const size_t length) const {
            return Vector<T>::init(length, *allocator_);
        }

        template <Numeric T>
        Vector<T> vector_zeros(const size_t length) const {
            return Vector<T>::zeros(length, *allocator_);
        }

        template <Numeric T>
        Vector<T> vector_splat(const size_t length, const T value) const {
            return Vector<T>::splat(length, value, *allocator_);
        }

        template <Numeric T>
        Vector<T> vector_from_data(const std::vector<T>& values) const {
            return Vector<T>::from_data(values, *allocator_);
        }

        // Adopt `data` allocated from allocator(); on a count mismatch nothing is adopted
        template <Numeric T>
        Tensor<T> tensor_from_owned_data(T* data, const size_t count, std::vector<size_t> shape) const {
            return Tensor<T>::from_owned_data(data, count, std::move(shape), *allocator_);
        }

        template <Numeric T>
        Matrix<T> matrix_from_owned_data(T* data, const size_t count, const size_t rows, const size_t columns) const {
            return Matrix<T>::from_owned_data(data, count, rows, columns, *allocator_);
        }

        template <Numeric T>
        Vector<T> vector_from_owned_data(T* data, const size_t count, const size_t length) const {
            return Vector<T>::from_owned_data(data, count, length, *allocator_);
        }

        // ============= Element-wise =============

        template <Container C, typename Fn>
        C op(const C& a, const C& b, Fn fn) {
            auto out = like(a);
            backend_.op(a, b, out, fn);
            return out;
        }

        template <Container C, typename Fn>
        void op_in_place(C& a, const C& b, Fn fn) {
            backend_.op(a, b, a, fn);
        }

        template <Container C, typename Fn>
        void op_with_out(const C& a, const C& b, C& out, Fn fn) {
            backend_.op(a, b, out, fn);
        }

        template <Container C, typename Fn>
        C map(const C& a, Fn fn) {
            auto out = like(a);
            backend_.map(a, out, fn);
            return out;
        }

        template <Container C, typename Fn>
        void map_in_place(C& a, Fn fn) {
            backend_.map(a, a, fn);
        }

        template <Container C, typename Fn>
        void map_with_out(const C& a, C& out, Fn fn) {
            backend_.map(a, out, fn);
        }

        // The scalar must already be the element type; no implicit conversion
        template <Container C, typename S>
            requires std::same_as<S, typename C::value_type>
        C scalar_multiply(const C& a, const S scalar) {
            auto out = like(a);
            backend_.scalar_multiply(a, scalar, out);
            return out;
        }

        template <Container C, typename S>
            requires std::same_as<S, typename C::value_type>
        void scalar_multiply_in_place(C& a, const S scalar) {
            backend_.scalar_multiply(a, scalar, a);
        }

        template <Container C, typename S>
            requires std::same_as<S, typename C::value_type>
        void scalar_multiply_with_out(const C& a, const S scalar, C& out) {
            backend_.scalar_multiply(a, scalar, out);
        }

        template <Container C>
        C add(const C& a, const C& b) { return op(a, b, ops::Add{}); }
        template <Container C>
        C subtract(const C& a, const C& b) { return op(a, b, ops::Subtract{}); }
        template <Container C>
        C multiply(const C& a, const C& b) { return op(a, b, ops::Multiply{}); }
        template <Container C>
        C divide(const C& a, const C& b) { return op(a, b, ops::Divide{}); }

        template <Container C>
        void add_in_place(C& a, const C& b) { op_in_place(a, b, ops::Add{}); }
        template <Container C>
        void subtract_in_place(C& a, const C& b) { op_in_place(a, b, ops::Subtract{}); }
        template <Container C>
        void multiply_in_place(C& a, const C& b) { op_in_place(a, b, ops::Multiply{}); }
        template <Container C>
        void divide_in_place(C& a, const C& b) { op_in_place(a, b, ops::Divide{}); }

        template <Container C>
        void add_with_out(const C& a, const C& b, C& out) { op_with_out(a, b, out, ops::Add{}); }
        template <Container C>
        void subtract_with_out(const C& a, const C& b, C& out) { op_with_out(a, b, out, ops::Subtract{}); }
        template <Container C>
        void multiply_with_out(const C& a, const C& b, C& out) { op_with_out(a, b, out, ops::Multiply{}); }
        template <Container C>
        void divide_with_out(const C& a, const C& b, C& out) { op_with_out(a, b, out, ops::Divide{}); }

        // ============= Vector reductions =============

        template <Numeric T>
        T vector_dot(const Vector<T>& a, const Vector<T>& b) {
            return backend_.vector_dot(a, b);
        }

        template <Numeric T>
        T vector_norm(const Vector<T>& v) {
            return backend_.vector_norm(v);
        }

        // ============= Matrix products =============

        template <Numeric T>
        Vector<T> matrix_vector_multiply(const Matrix<T>& m, const Vector<T>& v) {
            auto out = Vector<T>::init(m.rows(), *allocator_);
            backend_.matrix_vector_multiply(m, v, out);
            return out;
        }

        template <Numeric T>
        void matrix_vector_multiply_with_out(const Matrix<T>& m, const Vector<T>& v, Vector<T>& out) {
            backend_.matrix_vector_multiply(m, v, out);
        }

        template <Numeric T>
        Matrix<T> matrix_multiply(const Matrix<T>& a, const Matrix<T>& b) {
            auto out = Matrix<T>::init(a.rows(), b.columns(), *allocator_);
            backend_.matrix_multiply(a, b, out);
            return out;
        }

        template <Numeric T>
        void matrix_multiply_with_out(const Matrix<T>& a, const Matrix<T>& b, Matrix<T>& out) {
            backend_.matrix_multiply(a, b, out);
        }

        template <Numeric T>
        Matrix<T> matrix_transpose(const Matrix<T>& m) {
            auto out = Matrix<T>::init(m.columns(), m.rows(), *allocator_);
            backend_.matrix_transpose(m, out);
            return out;
        }

        template <Numeric T>
        void matrix_transpose_with_out(const Matrix<T>& m, Matrix<T>& out) {
            backend_.matrix_transpose(m, out);
        }

    private:
        template <Numeric T>
        Tensor<T> like(const Tensor<T>& a) const { return Tensor<T>::init(a.shape(), *allocator_); }
        template <Numeric T>
        Matrix<T> like(const Matrix<T>& a) const { return Matrix<T>::init(a.rows(), a.columns(), *allocator_); }
        template <Numeric T>
        Vector<T> like(const Vector<T>& a) const { return Vector<T>::init(a.length(), *allocator_); }

        B backend_;
        Allocator* allocator_;
    };

} // namespace zit::core
