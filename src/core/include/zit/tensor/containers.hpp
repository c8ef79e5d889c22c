/* SPDX-FileCopyrightText: 2025 zit Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "zit/tensor/allocator.hpp"
#include "zit/tensor/numeric.hpp"
#include "zit/tensor/tensor_error.hpp"
#include <algorithm>
#include <cassert>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace zit::core {

    namespace detail {

        inline size_t checked_element_count(std::span<const size_t> shape) {
            size_t n = 1;
            for (const size_t d : shape) {
                if (d != 0 && n > std::numeric_limits<size_t>::max() / d)
                    throw_tensor_error(ErrorCode::InvalidDimensions, "shape product overflows size_t");
                n *= d;
            }
            return n;
        }

        // Contiguous element storage owned through an Allocator.
        // A moved-from or released buffer holds nothing and frees nothing.
        template <Numeric T>
        class OwnedBuffer {
        public:
            OwnedBuffer(const size_t count, Allocator& alloc)
                : data_(static_cast<T*>(alloc.allocate(bytes_for(count)))),
                  size_(count),
                  allocator_(&alloc) {}

            // Adopts `data`, which must come from `alloc`
            OwnedBuffer(T* data, const size_t count, Allocator& alloc)
                : data_(data),
                  size_(count),
                  allocator_(&alloc) {}

            OwnedBuffer(const OwnedBuffer&) = delete;
            OwnedBuffer& operator=(const OwnedBuffer&) = delete;

            OwnedBuffer(OwnedBuffer&& other) noexcept
                : data_(std::exchange(other.data_, nullptr)),
                  size_(std::exchange(other.size_, 0)),
                  allocator_(other.allocator_),
                  released_(std::exchange(other.released_, true)) {}

            OwnedBuffer& operator=(OwnedBuffer&& other) noexcept {
                if (this != &other) {
                    if (!released_)
                        free();
                    data_ = std::exchange(other.data_, nullptr);
                    size_ = std::exchange(other.size_, 0);
                    allocator_ = other.allocator_;
                    released_ = std::exchange(other.released_, true);
                }
                return *this;
            }

            ~OwnedBuffer() {
                if (!released_)
                    free();
            }

            void release() {
                assert(!released_ && "container released twice");
                if (!released_)
                    free();
            }

            OwnedBuffer clone() const {
                T* copy = static_cast<T*>(allocator_->duplicate(data_, bytes_for(size_)));
                return OwnedBuffer(copy, size_, *allocator_);
            }

            T* data() noexcept { return data_; }
            const T* data() const noexcept { return data_; }
            size_t size() const noexcept { return size_; }
            bool released() const noexcept { return released_; }
            Allocator& allocator() const noexcept { return *allocator_; }

        private:
            static size_t bytes_for(const size_t count) {
                if (count > std::numeric_limits<size_t>::max() / sizeof(T))
                    throw_tensor_error(ErrorCode::OutOfMemory, "element count exceeds addressable bytes");
                return count * sizeof(T);
            }

            void free() noexcept {
                allocator_->deallocate(data_, size_ * sizeof(T));
                data_ = nullptr;
                size_ = 0;
                released_ = true;
            }

            T* data_ = nullptr;
            size_t size_ = 0;
            Allocator* allocator_ = nullptr;
            bool released_ = false;
        };

    } // namespace detail

    // ============= Tensor (rank-N) =============

    template <Numeric T>
    class Tensor {
    public:
        using value_type = T;

        static Tensor init(std::vector<size_t> shape, Allocator& alloc = default_allocator()) {
            const size_t n = detail::checked_element_count(shape);
            return Tensor(detail::OwnedBuffer<T>(n, alloc), std::move(shape));
        }

        static Tensor zeros(std::vector<size_t> shape, Allocator& alloc = default_allocator()) {
            return splat(std::move(shape), T{0}, alloc);
        }

        static Tensor splat(std::vector<size_t> shape, const T value, Allocator& alloc = default_allocator()) {
            auto t = init(std::move(shape), alloc);
            t.fill(value);
            return t;
        }

        // Takes ownership of `data` (allocated from `alloc`) on success only
        static Tensor from_owned_data(T* data, const size_t count, std::vector<size_t> shape,
                                      Allocator& alloc = default_allocator()) {
            const size_t n = detail::checked_element_count(shape);
            if (n != count) {
                throw_tensor_error(ErrorCode::InvalidDimensions,
                                   "tensor data has " + std::to_string(count) +
                                       " elements, shape requires " + std::to_string(n));
            }
            return Tensor(detail::OwnedBuffer<T>(data, count, alloc), std::move(shape));
        }

        static Tensor from_data(const std::vector<T>& values, std::vector<size_t> shape,
                                Allocator& alloc = default_allocator()) {
            const size_t n = detail::checked_element_count(shape);
            if (n != values.size()) {
                throw_tensor_error(ErrorCode::InvalidDimensions,
                                   "tensor data has " + std::to_string(values.size()) +
                                       " elements, shape requires " + std::to_string(n));
            }
            auto t = init(std::move(shape), alloc);
            std::copy(values.begin(), values.end(), t.data());
            return t;
        }

        Tensor(Tensor&&) noexcept = default;
        Tensor& operator=(Tensor&&) noexcept = default;

        // Leaves shape {0}: a released tensor is empty, never a rank-0 scalar
        void release() {
            buffer_.release();
            shape_.assign(1, 0);
        }

        Tensor clone() const { return Tensor(buffer_.clone(), shape_); }

        const std::vector<size_t>& shape() const noexcept { return shape_; }
        size_t rank() const noexcept { return shape_.size(); }
        size_t size() const noexcept { return buffer_.size(); }
        bool empty() const noexcept { return buffer_.size() == 0; }
        bool is_released() const noexcept { return buffer_.released(); }
        Allocator& allocator() const noexcept { return buffer_.allocator(); }

        T* data() noexcept { return buffer_.data(); }
        const T* data() const noexcept { return buffer_.data(); }
        T* begin() noexcept { return buffer_.data(); }
        T* end() noexcept { return buffer_.data() + buffer_.size(); }
        const T* begin() const noexcept { return buffer_.data(); }
        const T* end() const noexcept { return buffer_.data() + buffer_.size(); }

        T& operator[](const size_t flat) { return buffer_.data()[flat]; }
        const T& operator[](const size_t flat) const { return buffer_.data()[flat]; }

        T& at(std::initializer_list<size_t> indices) { return buffer_.data()[offset_of(indices)]; }
        const T& at(std::initializer_list<size_t> indices) const { return buffer_.data()[offset_of(indices)]; }
        T& at(std::span<const size_t> indices) { return buffer_.data()[offset_of(indices)]; }
        const T& at(std::span<const size_t> indices) const { return buffer_.data()[offset_of(indices)]; }

        void fill(const T value) { std::fill(begin(), end(), value); }

    private:
        Tensor(detail::OwnedBuffer<T> buffer, std::vector<size_t> shape)
            : buffer_(std::move(buffer)),
              shape_(std::move(shape)) {}

        size_t offset_of(std::span<const size_t> indices) const {
            if (indices.size() != shape_.size()) {
                throw_tensor_error(ErrorCode::OutOfBounds,
                                   "expected " + std::to_string(shape_.size()) + " indices, got " +
                                       std::to_string(indices.size()));
            }
            size_t offset = 0;
            for (size_t d = 0; d < shape_.size(); ++d) {
                if (indices[d] >= shape_[d]) {
                    throw_tensor_error(ErrorCode::OutOfBounds,
                                       "index " + std::to_string(indices[d]) + " out of range for dim " +
                                           std::to_string(d) + " of size " + std::to_string(shape_[d]));
                }
                offset = offset * shape_[d] + indices[d];
            }
            return offset;
        }

        size_t offset_of(std::initializer_list<size_t> indices) const {
            return offset_of(std::span<const size_t>(indices.begin(), indices.size()));
        }

        detail::OwnedBuffer<T> buffer_;
        std::vector<size_t> shape_;
    };

    // ============= Matrix (rank-2, row-major) =============

    template <Numeric T>
    class Matrix {
    public:
        using value_type = T;

        static Matrix init(const size_t rows, const size_t columns, Allocator& alloc = default_allocator()) {
            const size_t extents[] = {rows, columns};
            return Matrix(detail::OwnedBuffer<T>(detail::checked_element_count(extents), alloc), rows, columns);
        }

        static Matrix zeros(const size_t rows, const size_t columns, Allocator& alloc = default_allocator()) {
            return splat(rows, columns, T{0}, alloc);
        }

        static Matrix splat(const size_t rows, const size_t columns, const T value,
                            Allocator& alloc = default_allocator()) {
            auto m = init(rows, columns, alloc);
            m.fill(value);
            return m;
        }

        static Matrix from_owned_data(T* data, const size_t count, const size_t rows, const size_t columns,
                                      Allocator& alloc = default_allocator()) {
            const size_t extents[] = {rows, columns};
            const size_t n = detail::checked_element_count(extents);
            if (n != count) {
                throw_tensor_error(ErrorCode::InvalidDimensions,
                                   "matrix data has " + std::to_string(count) + " elements, " +
                                       std::to_string(rows) + "x" + std::to_string(columns) + " requires " +
                                       std::to_string(n));
            }
            return Matrix(detail::OwnedBuffer<T>(data, count, alloc), rows, columns);
        }

        static Matrix from_data(const std::vector<T>& values, const size_t rows, const size_t columns,
                                Allocator& alloc = default_allocator()) {
            if (values.size() != rows * columns) {
                throw_tensor_error(ErrorCode::InvalidDimensions,
                                   "matrix data has " + std::to_string(values.size()) + " elements, " +
                                       std::to_string(rows) + "x" + std::to_string(columns) + " requires " +
                                       std::to_string(rows * columns));
            }
            auto m = init(rows, columns, alloc);
            std::copy(values.begin(), values.end(), m.data());
            return m;
        }

        Matrix(Matrix&&) noexcept = default;
        Matrix& operator=(Matrix&&) noexcept = default;

        void release() {
            buffer_.release();
            rows_ = 0;
            columns_ = 0;
        }

        Matrix clone() const { return Matrix(buffer_.clone(), rows_, columns_); }

        size_t rows() const noexcept { return rows_; }
        size_t columns() const noexcept { return columns_; }
        std::vector<size_t> shape() const { return {rows_, columns_}; }
        size_t size() const noexcept { return buffer_.size(); }
        bool empty() const noexcept { return buffer_.size() == 0; }
        bool is_released() const noexcept { return buffer_.released(); }
        Allocator& allocator() const noexcept { return buffer_.allocator(); }

        T* data() noexcept { return buffer_.data(); }
        const T* data() const noexcept { return buffer_.data(); }
        T* begin() noexcept { return buffer_.data(); }
        T* end() noexcept { return buffer_.data() + buffer_.size(); }
        const T* begin() const noexcept { return buffer_.data(); }
        const T* end() const noexcept { return buffer_.data() + buffer_.size(); }

        T& operator[](const size_t flat) { return buffer_.data()[flat]; }
        const T& operator[](const size_t flat) const { return buffer_.data()[flat]; }

        T& at(const size_t row, const size_t column) { return buffer_.data()[offset_of(row, column)]; }
        const T& at(const size_t row, const size_t column) const { return buffer_.data()[offset_of(row, column)]; }

        void fill(const T value) { std::fill(begin(), end(), value); }

    private:
        Matrix(detail::OwnedBuffer<T> buffer, const size_t rows, const size_t columns)
            : buffer_(std::move(buffer)),
              rows_(rows),
              columns_(columns) {}

        size_t offset_of(const size_t row, const size_t column) const {
            if (row >= rows_ || column >= columns_) {
                throw_tensor_error(ErrorCode::OutOfBounds,
                                   "index (" + std::to_string(row) + ", " + std::to_string(column) +
                                       ") out of range for " + std::to_string(rows_) + "x" +
                                       std::to_string(columns_) + " matrix");
            }
            return row * columns_ + column;
        }

        detail::OwnedBuffer<T> buffer_;
        size_t rows_;
        size_t columns_;
    };

    // ============= Vector (rank-1) =============

    template <Numeric T>
    class Vector {
    public:
        using value_type = T;

        static Vector init(const size_t length, Allocator& alloc = default_allocator()) {
            return Vector(detail::OwnedBuffer<T>(length, alloc));
        }

        static Vector zeros(const size_t length, Allocator& alloc = default_allocator()) {
            return splat(length, T{0}, alloc);
        }

        static Vector splat(const size_t length, const T value, Allocator& alloc = default_allocator()) {
            auto v = init(length, alloc);
            v.fill(value);
            return v;
        }

        static Vector from_owned_data(T* data, const size_t count, const size_t length,
                                      Allocator& alloc = default_allocator()) {
            if (count != length) {
                throw_tensor_error(ErrorCode::InvalidDimensions,
                                   "vector data has " + std::to_string(count) + " elements, length is " +
                                       std::to_string(length));
            }
            return Vector(detail::OwnedBuffer<T>(data, count, alloc));
        }

        static Vector from_data(const std::vector<T>& values, Allocator& alloc = default_allocator()) {
            auto v = init(values.size(), alloc);
            std::copy(values.begin(), values.end(), v.data());
            return v;
        }

        Vector(Vector&&) noexcept = default;
        Vector& operator=(Vector&&) noexcept = default;

        void release() { buffer_.release(); }

        Vector clone() const { return Vector(buffer_.clone()); }

        size_t length() const noexcept { return buffer_.size(); }
        std::vector<size_t> shape() const { return {buffer_.size()}; }
        size_t size() const noexcept { return buffer_.size(); }
        bool empty() const noexcept { return buffer_.size() == 0; }
        bool is_released() const noexcept { return buffer_.released(); }
        Allocator& allocator() const noexcept { return buffer_.allocator(); }

        T* data() noexcept { return buffer_.data(); }
        const T* data() const noexcept { return buffer_.data(); }
        T* begin() noexcept { return buffer_.data(); }
        T* end() noexcept { return buffer_.data() + buffer_.size(); }
        const T* begin() const noexcept { return buffer_.data(); }
        const T* end() const noexcept { return buffer_.data() + buffer_.size(); }

        T& operator[](const size_t i) { return buffer_.data()[i]; }
        const T& operator[](const size_t i) const { return buffer_.data()[i]; }

        T& at(const size_t i) { return buffer_.data()[offset_of(i)]; }
        const T& at(const size_t i) const { return buffer_.data()[offset_of(i)]; }

        void fill(const T value) { std::fill(begin(), end(), value); }

    private:
        explicit Vector(detail::OwnedBuffer<T> buffer)
            : buffer_(std::move(buffer)) {}

        size_t offset_of(const size_t i) const {
            if (i >= buffer_.size()) {
                throw_tensor_error(ErrorCode::OutOfBounds,
                                   "index " + std::to_string(i) + " out of range for vector of length " +
                                       std::to_string(buffer_.size()));
            }
            return i;
        }

        detail::OwnedBuffer<T> buffer_;
    };

    // ============= Container traits =============

    template <typename C>
    struct container_traits {
        static constexpr bool is_container = false;
    };

    template <Numeric T>
    struct container_traits<Tensor<T>> {
        static constexpr bool is_container = true;
        static constexpr std::string_view kind = "Tensor";
    };

    template <Numeric T>
    struct container_traits<Matrix<T>> {
        static constexpr bool is_container = true;
        static constexpr std::string_view kind = "Matrix";
    };

    template <Numeric T>
    struct container_traits<Vector<T>> {
        static constexpr bool is_container = true;
        static constexpr std::string_view kind = "Vector";
    };

    template <typename C>
    concept Container = container_traits<std::remove_cvref_t<C>>::is_container;

} // namespace zit::core
