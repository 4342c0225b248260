#include "dcp/hdf5_array.hpp"
#include "dcp/errors.hpp"
#include <algorithm>
#include <sstream>

namespace dcp {
namespace {
// Closes an HDF5 identifier on scope exit.
struct Handle {
    hid_t id;
    herr_t (*close)(hid_t);
    Handle(hid_t i, herr_t (*c)(hid_t)) : id(i), close(c) {}
    ~Handle() { if (id >= 0) close(id); }
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;
    operator hid_t() const { return id; }
};

void check(herr_t status, const std::string& what) {
    if (status < 0) throw IoError("HDF5: " + what);
}

hid_t check_id(hid_t id, const std::string& what) {
    if (id < 0) throw IoError("HDF5: " + what);
    return id;
}

hid_t native_type(int cv_type) {
    switch (CV_MAT_DEPTH(cv_type)) {
        case CV_8U: return H5T_NATIVE_UINT8;
        case CV_8S: return H5T_NATIVE_INT8;
        case CV_16U: return H5T_NATIVE_UINT16;
        case CV_16S: return H5T_NATIVE_INT16;
        case CV_32S: return H5T_NATIVE_INT32;
        case CV_32F: return H5T_NATIVE_FLOAT;
        case CV_64F: return H5T_NATIVE_DOUBLE;
    }
    throw IoError("Unsupported cv type " + std::to_string(cv_type));
}

int cv_type_of(hid_t dtype) {
    H5T_class_t cls = H5Tget_class(dtype);
    size_t size = H5Tget_size(dtype);
    if (cls == H5T_INTEGER) {
        bool is_signed = H5Tget_sign(dtype) == H5T_SGN_2;
        switch (size) {
            case 1: return is_signed ? CV_8S : CV_8U;
            case 2: return is_signed ? CV_16S : CV_16U;
            case 4: if (is_signed) return CV_32S; break;
        }
    } else if (cls == H5T_FLOAT) {
        if (size == 4) return CV_32F;
        if (size == 8) return CV_64F;
    } else if (cls == H5T_ENUM && size == 1) {
        // booleans as written by h5py: int8 enum {FALSE=0, TRUE=1}
        return CV_8U;
    }
    throw IoError("Unsupported HDF5 element type (class " + std::to_string(cls) +
                  ", size " + std::to_string(size) + ")");
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/'))
        if (!item.empty()) parts.push_back(item);
    return parts;
}

hid_t link_create_plist() {
    hid_t lcpl = check_id(H5Pcreate(H5P_LINK_CREATE), "link property list");
    H5Pset_create_intermediate_group(lcpl, 1);
    return lcpl;
}
}  // namespace

std::mutex& hdf5_mutex() {
    static std::mutex mu;
    return mu;
}

Hdf5File::Hdf5File(const std::string& path, Mode mode) : path_(path), mode_(mode) {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    switch (mode) {
        case Mode::ReadOnly: id_ = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT); break;
        case Mode::ReadWrite: id_ = H5Fopen(path.c_str(), H5F_ACC_RDWR, H5P_DEFAULT); break;
        case Mode::Truncate:
            id_ = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
            break;
    }
    if (id_ < 0) throw IoError("Could not open HDF5 file " + path);
}

Hdf5File::~Hdf5File() {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    if (id_ >= 0) H5Fclose(id_);
}

bool Hdf5File::has(const std::string& object) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    std::string cur;
    for (auto& part : split_path(object)) {
        cur += "/" + part;
        if (H5Lexists(id_, cur.c_str(), H5P_DEFAULT) <= 0) return false;
    }
    return !cur.empty();
}

std::vector<hsize_t> Hdf5File::dims(const std::string& dataset) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle ds(check_id(H5Dopen2(id_, dataset.c_str(), H5P_DEFAULT), "open " + dataset), H5Dclose);
    Handle space(H5Dget_space(ds), H5Sclose);
    int rank = H5Sget_simple_extent_ndims(space);
    std::vector<hsize_t> out(std::max(rank, 0));
    if (rank > 0) H5Sget_simple_extent_dims(space, out.data(), nullptr);
    return out;
}

std::vector<double> Hdf5File::read_vector(const std::string& dataset) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle ds(check_id(H5Dopen2(id_, dataset.c_str(), H5P_DEFAULT), "open " + dataset), H5Dclose);
    Handle space(H5Dget_space(ds), H5Sclose);
    hssize_t n = H5Sget_simple_extent_npoints(space);
    std::vector<double> out(std::max<hssize_t>(n, 0));
    if (!out.empty())
        check(H5Dread(ds, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()),
              "read " + dataset);
    return out;
}

void Hdf5File::append_vector(const std::string& dataset, const std::vector<double>& values) {
    if (values.empty()) return;
    bool exists = has(dataset);
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    hsize_t n = values.size();
    hsize_t old = 0;
    hid_t raw_id;
    if (!exists) {
        hsize_t dims[1] = {0}, maxdims[1] = {H5S_UNLIMITED}, chunk[1] = {1000};
        Handle space(H5Screate_simple(1, dims, maxdims), H5Sclose);
        Handle dcpl(H5Pcreate(H5P_DATASET_CREATE), H5Pclose);
        H5Pset_chunk(dcpl, 1, chunk);
        Handle lcpl(link_create_plist(), H5Pclose);
        raw_id = H5Dcreate2(id_, dataset.c_str(), H5T_NATIVE_DOUBLE, space, lcpl, dcpl, H5P_DEFAULT);
    } else {
        raw_id = H5Dopen2(id_, dataset.c_str(), H5P_DEFAULT);
    }
    Handle ds(check_id(raw_id, "open " + dataset), H5Dclose);
    {
        Handle space(H5Dget_space(ds), H5Sclose);
        H5Sget_simple_extent_dims(space, &old, nullptr);
    }
    hsize_t total = old + n;
    check(H5Dset_extent(ds, &total), "extend " + dataset);
    Handle fspace(H5Dget_space(ds), H5Sclose);
    check(H5Sselect_hyperslab(fspace, H5S_SELECT_SET, &old, nullptr, &n, nullptr), "select");
    Handle mspace(H5Screate_simple(1, &n, nullptr), H5Sclose);
    check(H5Dwrite(ds, H5T_NATIVE_DOUBLE, mspace, fspace, H5P_DEFAULT, values.data()),
          "write " + dataset);
}

bool Hdf5File::has_attr(const std::string& name) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle root(H5Gopen2(id_, "/", H5P_DEFAULT), H5Gclose);
    return H5Aexists(root, name.c_str()) > 0;
}

double Hdf5File::attr_double(const std::string& name) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle root(H5Gopen2(id_, "/", H5P_DEFAULT), H5Gclose);
    Handle attr(check_id(H5Aopen(root, name.c_str(), H5P_DEFAULT), "attribute " + name), H5Aclose);
    double value = 0;
    check(H5Aread(attr, H5T_NATIVE_DOUBLE, &value), "read attribute " + name);
    return value;
}

std::string Hdf5File::attr_string(const std::string& name) const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle root(H5Gopen2(id_, "/", H5P_DEFAULT), H5Gclose);
    Handle attr(check_id(H5Aopen(root, name.c_str(), H5P_DEFAULT), "attribute " + name), H5Aclose);
    Handle ftype(H5Aget_type(attr), H5Tclose);
    if (H5Tget_class(ftype) != H5T_STRING) throw IoError("Attribute " + name + " is not a string");
    if (H5Tis_variable_str(ftype) > 0) {
        Handle mtype(H5Tcopy(H5T_C_S1), H5Tclose);
        H5Tset_size(mtype, H5T_VARIABLE);
        char* buf = nullptr;
        check(H5Aread(attr, mtype, &buf), "read attribute " + name);
        std::string out = buf ? buf : "";
        H5free_memory(buf);
        return out;
    }
    size_t size = H5Tget_size(ftype);
    std::string out(size, '\0');
    check(H5Aread(attr, ftype, &out[0]), "read attribute " + name);
    out.erase(std::find(out.begin(), out.end(), '\0'), out.end());
    return out;
}

void Hdf5File::set_attr(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle root(H5Gopen2(id_, "/", H5P_DEFAULT), H5Gclose);
    if (H5Aexists(root, name.c_str()) > 0) H5Adelete(root, name.c_str());
    Handle type(H5Tcopy(H5T_C_S1), H5Tclose);
    H5Tset_size(type, std::max<size_t>(value.size(), 1));
    Handle space(H5Screate(H5S_SCALAR), H5Sclose);
    Handle attr(check_id(H5Acreate2(root, name.c_str(), type, space, H5P_DEFAULT, H5P_DEFAULT),
                         "create attribute " + name), H5Aclose);
    std::string padded = value.empty() ? std::string(1, '\0') : value;
    check(H5Awrite(attr, type, padded.c_str()), "write attribute " + name);
}

void Hdf5File::set_attr(const std::string& name, double value) {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle root(H5Gopen2(id_, "/", H5P_DEFAULT), H5Gclose);
    if (H5Aexists(root, name.c_str()) > 0) H5Adelete(root, name.c_str());
    Handle space(H5Screate(H5S_SCALAR), H5Sclose);
    Handle attr(check_id(H5Acreate2(root, name.c_str(), H5T_NATIVE_DOUBLE, space, H5P_DEFAULT,
                                    H5P_DEFAULT), "create attribute " + name), H5Aclose);
    check(H5Awrite(attr, H5T_NATIVE_DOUBLE, &value), "write attribute " + name);
}

void Hdf5File::flush() {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    check(H5Fflush(id_, H5F_SCOPE_LOCAL), "flush " + path_);
}

Hdf5ImageDataset::Hdf5ImageDataset(FilePtr file, std::string dataset)
    : file_(std::move(file)), dataset_(std::move(dataset)) {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    id_ = check_id(H5Dopen2(file_->id(), dataset_.c_str(), H5P_DEFAULT), "open " + dataset_);
    Handle space(H5Dget_space(id_), H5Sclose);
    if (H5Sget_simple_extent_ndims(space) != 3) {
        H5Dclose(id_);
        throw IoError(dataset_ + " is not an (N, H, W) image stack");
    }
    hsize_t dims[3];
    H5Sget_simple_extent_dims(space, dims, nullptr);
    frame_size_ = cv::Size(static_cast<int>(dims[2]), static_cast<int>(dims[1]));
    Handle dtype(H5Dget_type(id_), H5Tclose);
    is_enum_ = H5Tget_class(dtype) == H5T_ENUM;
    try {
        type_ = cv_type_of(dtype);
    } catch (...) {
        H5Dclose(id_);
        throw;
    }
}

Hdf5ImageDataset::~Hdf5ImageDataset() {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    if (id_ >= 0) H5Dclose(id_);
}

std::shared_ptr<Hdf5ImageDataset> Hdf5ImageDataset::create(FilePtr file, const std::string& dataset,
                                                           cv::Size frame_size, int type, int length,
                                                           bool compress) {
    {
        std::lock_guard<std::mutex> lk(hdf5_mutex());
        hsize_t dims[3] = {static_cast<hsize_t>(length), static_cast<hsize_t>(frame_size.height),
                           static_cast<hsize_t>(frame_size.width)};
        hsize_t maxdims[3] = {H5S_UNLIMITED, dims[1], dims[2]};
        hsize_t chunk[3] = {100, std::max<hsize_t>(dims[1], 1), std::max<hsize_t>(dims[2], 1)};
        Handle space(H5Screate_simple(3, dims, maxdims), H5Sclose);
        Handle dcpl(H5Pcreate(H5P_DATASET_CREATE), H5Pclose);
        check(H5Pset_chunk(dcpl, 3, chunk), "chunk layout for " + dataset);
        if (compress && H5Zfilter_avail(H5Z_FILTER_DEFLATE) > 0) H5Pset_deflate(dcpl, 4);
        Handle lcpl(link_create_plist(), H5Pclose);
        Handle ds(check_id(H5Dcreate2(file->id(), dataset.c_str(), native_type(type), space, lcpl,
                                      dcpl, H5P_DEFAULT), "create " + dataset), H5Dclose);
    }
    return std::make_shared<Hdf5ImageDataset>(std::move(file), dataset);
}

hid_t Hdf5ImageDataset::memory_type() const {
    if (!is_enum_) return H5Tcopy(native_type(type_));
    // HDF5 does not convert between enums and integers; use the stored enum.
    Handle ftype(H5Dget_type(id_), H5Tclose);
    return H5Tget_native_type(ftype, H5T_DIR_ASCEND);
}

int Hdf5ImageDataset::length() const {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    Handle space(H5Dget_space(id_), H5Sclose);
    hsize_t dims[3];
    H5Sget_simple_extent_dims(space, dims, nullptr);
    return static_cast<int>(dims[0]);
}

ImageStack Hdf5ImageDataset::read(int start, int stop) const {
    stop = std::min(stop, length());
    if (start < 0 || start > stop)
        throw OutOfBounds("Slice [" + std::to_string(start) + ", " + std::to_string(stop) +
                          ") out of bounds for " + name());
    ImageStack out(stop - start, frame_size_, type_);
    if (out.size() == 0) return out;
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    hsize_t offset[3] = {static_cast<hsize_t>(start), 0, 0};
    hsize_t count[3] = {static_cast<hsize_t>(stop - start), static_cast<hsize_t>(frame_size_.height),
                        static_cast<hsize_t>(frame_size_.width)};
    Handle fspace(H5Dget_space(id_), H5Sclose);
    check(H5Sselect_hyperslab(fspace, H5S_SELECT_SET, offset, nullptr, count, nullptr), "select");
    Handle mspace(H5Screate_simple(3, count, nullptr), H5Sclose);
    Handle mtype(check_id(memory_type(), "memory type of " + name()), H5Tclose);
    check(H5Dread(id_, mtype, mspace, fspace, H5P_DEFAULT, out.data.data), "read " + name());
    return out;
}

void Hdf5ImageDataset::resize(int length) {
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    hsize_t dims[3] = {static_cast<hsize_t>(length), static_cast<hsize_t>(frame_size_.height),
                       static_cast<hsize_t>(frame_size_.width)};
    check(H5Dset_extent(id_, dims), "resize " + name());
}

void Hdf5ImageDataset::write(int start, const ImageStack& rows) {
    if (rows.frame_size != frame_size_) throw IoError("Frame size mismatch when writing to " + name());
    if (rows.size() == 0) return;
    if (start < 0 || start + rows.size() > length())
        throw OutOfBounds("Write [" + std::to_string(start) + ", " +
                          std::to_string(start + rows.size()) + ") out of bounds for " + name());
    cv::Mat buf;
    rows.data.convertTo(buf, type_);
    if (is_enum_) {
        cv::Mat flags = buf != 0;
        buf = flags / 255;
    }
    if (!buf.isContinuous()) buf = buf.clone();
    std::lock_guard<std::mutex> lk(hdf5_mutex());
    hsize_t offset[3] = {static_cast<hsize_t>(start), 0, 0};
    hsize_t count[3] = {static_cast<hsize_t>(rows.size()), static_cast<hsize_t>(frame_size_.height),
                        static_cast<hsize_t>(frame_size_.width)};
    Handle fspace(H5Dget_space(id_), H5Sclose);
    check(H5Sselect_hyperslab(fspace, H5S_SELECT_SET, offset, nullptr, count, nullptr), "select");
    Handle mspace(H5Screate_simple(3, count, nullptr), H5Sclose);
    Handle mtype(check_id(memory_type(), "memory type of " + name()), H5Tclose);
    check(H5Dwrite(id_, mtype, mspace, fspace, H5P_DEFAULT, buf.data), "write " + name());
}
}
