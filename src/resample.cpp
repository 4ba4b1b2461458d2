// ============================================================================
//  File: src/resample.cpp — Rééchantillonnage Lanczos-3 séparable
// ============================================================================

#include "resample.hpp"

#include <algorithm>
#include <cmath>

namespace EinkGallery
{

namespace
{

constexpr double kPi      = 3.14159265358979323846;
constexpr double kLobes   = 3.0;

double sinc(double x)
{
    if(x==0.0) return 1.0;
    x *= kPi;
    return std::sin(x)/x;
}
double lanczos3(double x)
{
    if(x<=-kLobes || x>=kLobes) return 0.0;
    return sinc(x)*sinc(x/kLobes);
}

// Contributions d’une dimension: pour chaque sortie i, [first, first+n) et poids.
struct Taps
{
    std::vector<int>    first;
    std::vector<int>    count;
    std::vector<double> weights; // n_max par sortie
    int n_max=0;
};

Taps compute_taps(int inSize, int outSize)
{
    Taps t;
    const double scale   = (double)outSize/(double)inSize;
    const double fscale  = scale<1.0 ? 1.0/scale : 1.0;
    const double support = kLobes*fscale;
    t.n_max = (int)std::ceil(support)*2 + 2;
    t.first.resize((size_t)outSize);
    t.count.resize((size_t)outSize);
    t.weights.assign((size_t)outSize*t.n_max, 0.0);

    for(int i=0; i<outSize; ++i)
    {
        const double center = ((double)i + 0.5)/scale;
        int lo = (int)std::floor(center - support);
        int hi = (int)std::ceil (center + support);
        lo = std::max(lo, 0);
        hi = std::min(hi, inSize);
        if(hi-lo > t.n_max) hi = lo + t.n_max;

        double* w = &t.weights[(size_t)i*t.n_max];
        double sum = 0.0;
        for(int k=lo; k<hi; ++k)
        {
            const double v = lanczos3(((double)k + 0.5 - center)/fscale);
            w[k-lo] = v;
            sum += v;
        }
        if(sum!=0.0)
        {
            for(int k=0; k<hi-lo; ++k) w[k] /= sum;
        }
        else
        {
            // fenêtre dégénérée: échantillon le plus proche
            lo = std::min(std::max((int)center, 0), inSize-1);
            hi = lo+1;
            w[0] = 1.0;
        }
        t.first[(size_t)i] = lo;
        t.count[(size_t)i] = hi-lo;
    }
    return t;
}

inline uint8_t to_u8(double v)
{
    long r = std::lround(v);
    if(r<0) r=0;
    if(r>255) r=255;
    return (uint8_t)r;
}

} // anon

void resize_rgb_lanczos(const ImageU8& src, int dstW, int dstH, ImageU8& dst)
{
    dst.w=dstW;
    dst.h=dstH;
    dst.c=3;
    dst.data.assign((size_t)dstW*dstH*3, 0);
    if(src.w<=0 || src.h<=0 || dstW<=0 || dstH<=0) return;
    if(src.w==dstW && src.h==dstH)
    {
        dst.data = src.data;
        return;
    }

    // Passe horizontale: src.w×src.h → dstW×src.h
    const Taps tx = compute_taps(src.w, dstW);
    std::vector<double> mid((size_t)dstW*src.h*3);
    for(int y=0; y<src.h; ++y)
    {
        for(int x=0; x<dstW; ++x)
        {
            const double* w = &tx.weights[(size_t)x*tx.n_max];
            const int f = tx.first[(size_t)x];
            double r=0,g=0,b=0;
            for(int k=0; k<tx.count[(size_t)x]; ++k)
            {
                const uint8_t* p = src.px(f+k, y);
                r += w[k]*p[0];
                g += w[k]*p[1];
                b += w[k]*p[2];
            }
            double* m = &mid[((size_t)y*dstW + x)*3];
            m[0]=r;
            m[1]=g;
            m[2]=b;
        }
    }

    // Passe verticale: dstW×src.h → dstW×dstH
    const Taps ty = compute_taps(src.h, dstH);
    for(int y=0; y<dstH; ++y)
    {
        const double* w = &ty.weights[(size_t)y*ty.n_max];
        const int f = ty.first[(size_t)y];
        for(int x=0; x<dstW; ++x)
        {
            double r=0,g=0,b=0;
            for(int k=0; k<ty.count[(size_t)y]; ++k)
            {
                const double* m = &mid[((size_t)(f+k)*dstW + x)*3];
                r += w[k]*m[0];
                g += w[k]*m[1];
                b += w[k]*m[2];
            }
            uint8_t* d = dst.px(x,y);
            d[0]=to_u8(r);
            d[1]=to_u8(g);
            d[2]=to_u8(b);
        }
    }
}

} // namespace EinkGallery
