#ifndef MATRIX_H
#define MATRIX_H

#include <cstddef>
#include <ostream>
#include <vector>
#include "array.h"
#include "container_errors.h"

// Row-major matrix stored as one Array per row.
// Cells are reached only through Array's bounds-checked access/update.
template <typename T>
class Matrix {
public:
    Matrix(std::size_t rows, std::size_t cols, const T& fill = T{}) : num_cols(cols) {
        row_arrays.reserve(rows);
        for (std::size_t r = 0; r < rows; r++) {
            row_arrays.emplace_back(cols);
            for (std::size_t c = 0; c < cols; c++) {
                row_arrays.back().insert(c, fill);
            }
        }
    }

    void set(std::size_t r, std::size_t c, const T& value) {
        row(r, "Matrix::set").update(c, value);
    }

    const T& get(std::size_t r, std::size_t c) const {
        return row(r, "Matrix::get").access(c);
    }

    std::size_t rows() const { return row_arrays.size(); }
    std::size_t cols() const { return num_cols; }

    const Array<T>& rowAt(std::size_t r) const { return row(r, "Matrix::rowAt"); }

private:
    std::vector<Array<T>> row_arrays;
    std::size_t num_cols;

    Array<T>& row(std::size_t r, const char* operation) {
        if (r >= row_arrays.size()) {
            throw IndexOutOfRange(indexMessage(operation, r, row_arrays.size()));
        }
        return row_arrays[r];
    }

    const Array<T>& row(std::size_t r, const char* operation) const {
        if (r >= row_arrays.size()) {
            throw IndexOutOfRange(indexMessage(operation, r, row_arrays.size()));
        }
        return row_arrays[r];
    }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Matrix<T>& matrix) {
    for (std::size_t r = 0; r < matrix.rows(); r++) {
        if (r > 0) os << '\n';
        os << matrix.rowAt(r);
    }
    return os;
}

#endif // MATRIX_H
