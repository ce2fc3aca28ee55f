// matrix/codec-matrix.h

// Copyright 2009-2011  Ondrej Glembek;  Microsoft Corporation;  Lukas Burget;
//                      Saarland University;  Petr Schwarz;  Yanmin Qian;
//                      Karel Vesely;  Go Vivace Inc.;  Haihua Xu
// Copyright 2026  slotcodec authors

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef SLOTCODEC_MATRIX_CODEC_MATRIX_H_
#define SLOTCODEC_MATRIX_CODEC_MATRIX_H_ 1

#include <vector>

#include "base/slotcodec-common.h"

namespace slotcodec {

typedef int32 MatrixIndexT;
typedef uint32 UnsignedMatrixIndexT;

template<typename Real> class Matrix;

/// \addtogroup matrix_group
/// @{

/// Dense row-major matrix holding the per-utterance slot matrices.  Sizes are
/// [num-slots, num-tokens], [num-slots, max-num-values + 2] or
/// [num-slots, num-actions]; all are small, so no BLAS backing is needed.
template<typename Real>
class Matrix {
 public:
  /// Empty constructor.
  Matrix() : num_rows_(0), num_cols_(0) {}

  /// Basic constructor.
  Matrix(const MatrixIndexT r, const MatrixIndexT c)
      : num_rows_(0), num_cols_(0) { Resize(r, c); }

  /// Returns number of rows (or zero for empty matrix).
  inline MatrixIndexT NumRows() const { return num_rows_; }

  /// Returns number of columns (or zero for empty matrix).
  inline MatrixIndexT NumCols() const { return num_cols_; }

  /// Gives pointer to raw data (const).
  inline const Real* Data() const { return data_.empty() ? NULL : &data_[0]; }

  /// Returns pointer to data for one row (const)
  inline const Real* RowData(MatrixIndexT i) const {
    SLOTCODEC_ASSERT(static_cast<UnsignedMatrixIndexT>(i) <
                     static_cast<UnsignedMatrixIndexT>(num_rows_));
    return &data_[static_cast<size_t>(i) * num_cols_];
  }

  /// Indexing operator, non-const
  /// (only checks sizes if compiled with -DSLOTCODEC_PARANOID)
  inline Real& operator() (MatrixIndexT r, MatrixIndexT c) {
#ifdef SLOTCODEC_PARANOID
    SLOTCODEC_ASSERT(static_cast<UnsignedMatrixIndexT>(r) <
                     static_cast<UnsignedMatrixIndexT>(num_rows_) &&
                     static_cast<UnsignedMatrixIndexT>(c) <
                     static_cast<UnsignedMatrixIndexT>(num_cols_));
#endif
    return data_[static_cast<size_t>(r) * num_cols_ + c];
  }

  /// Indexing operator, const
  /// (only checks sizes if compiled with -DSLOTCODEC_PARANOID)
  inline const Real operator() (MatrixIndexT r, MatrixIndexT c) const {
#ifdef SLOTCODEC_PARANOID
    SLOTCODEC_ASSERT(static_cast<UnsignedMatrixIndexT>(r) <
                     static_cast<UnsignedMatrixIndexT>(num_rows_) &&
                     static_cast<UnsignedMatrixIndexT>(c) <
                     static_cast<UnsignedMatrixIndexT>(num_cols_));
#endif
    return data_[static_cast<size_t>(r) * num_cols_ + c];
  }

  /// Sets matrix to zero.
  void SetZero();
  /// Sets all elements to a specific value.
  void Set(Real value);

  /// Sets cells [r, c_begin, c_begin + num_cols) of one row to "value".
  void SetRowRange(MatrixIndexT r, MatrixIndexT c_begin, MatrixIndexT num_cols,
                   Real value);

  /// Sets the sizes of the matrix and zeroes it.
  void Resize(const MatrixIndexT r, const MatrixIndexT c);

  /// Returns sum of all elements in matrix.
  Real Sum() const;

  /// Returns the maximum value in row r, and its column in *col; errors if
  /// the matrix has no columns.  Ties go to the lowest column.
  Real RowMax(MatrixIndexT r, MatrixIndexT *col) const;

  /// Returns true if ((*this)-other).FrobeniusNorm()
  /// <= tol * (*this).FrobeniusNorm().
  bool ApproxEqual(const Matrix<Real> &other, float tol = 0.01) const;

  /// Returns true if matrix is all zeros.
  bool IsZero(Real cutoff = 1.0e-05) const;

  /// Text output, as used in text archives: " [\n  a b \n  c d ]\n".
  void Write(std::ostream &out) const;

  /// Text input in the format written by Write().
  void Read(std::istream &in);

 private:
  std::vector<Real> data_;
  MatrixIndexT num_rows_;
  MatrixIndexT num_cols_;
};

/// @} end of "addtogroup matrix_group"

}  // namespace slotcodec

#endif  // SLOTCODEC_MATRIX_CODEC_MATRIX_H_
